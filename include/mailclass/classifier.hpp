#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include "mailclass/config.hpp"
#include "mailclass/document.hpp"
#include "mailclass/options.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

class SnapshotReader;

enum class ClassifierKind {
    Bayes,
    Trivial
};

const char* classifier_kind_name(ClassifierKind kind);
ClassifierKind parse_classifier_kind(const std::string& name);

/**
 * A trainable document classifier.
 *
 * Variants differ in how they tokenize, learn and score; the harness drives
 * all of them through this interface.
 *
 * Options may be changed while other threads learn and score: set_config
 * holds options_mutex_ exclusively, and variants read options_ under
 * read_options().
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    virtual ClassifierKind kind() const = 0;

    // Whether the document can be handled at all (e.g. has text content).
    virtual bool is_valid(const Document& doc) const = 0;

    virtual TokenSet parse(const Document& doc) const = 0;

    // Both throw ConfigurationError for the reserved or an empty category.
    virtual void learn(const std::string& category, const Document& doc) = 0;
    virtual void unlearn(const std::string& category, const Document& doc) = 0;

    // Category probabilities, best first. Empty when nothing was learned.
    virtual Scores score(const Document& doc) = 0;

    // Drop everything learned. Options and biases are kept.
    virtual void forget() = 0;

    // True when no message has been learned since construction or forget().
    virtual bool empty() const = 0;

    // Deep copy taken while every table of this classifier is locked.
    virtual std::unique_ptr<Classifier> clone() const = 0;

    // Throws ResourceError if the snapshot can't be written.
    virtual void save(const std::string& path) const = 0;

    // Load the tables written by save(); used by load_classifier().
    virtual void restore(SnapshotReader& reader) = 0;

    // Copy of the current options.
    ClassifierOptions options() const;

    // Merge option values; throws ConfigurationError and keeps the old
    // options when the result does not validate. on_disk is fixed at
    // construction.
    void set_config(const Config& config);
    void load_config(const std::string& path);
    void save_config(const std::string& path) const;

    int debug() const;
    void set_debug(int level);

protected:
    using OptionsLock = std::shared_lock<std::shared_mutex>;

    explicit Classifier(const ClassifierOptions& options);

    // Taken before any table lock.
    OptionsLock read_options() const { return OptionsLock(options_mutex_); }

    // Called with options_mutex_ held exclusively.
    virtual void on_options_changed() {}

    ClassifierOptions options_;

private:
    mutable std::shared_mutex options_mutex_;
};

std::unique_ptr<Classifier> make_classifier(ClassifierKind kind,
                                            const ClassifierOptions& options = ClassifierOptions{});

// Throws ResourceError / CorruptSnapshotError.
std::unique_ptr<Classifier> load_classifier(const std::string& path);

} // namespace mailclass
