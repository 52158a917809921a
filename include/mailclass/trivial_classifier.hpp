#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include "mailclass/classifier.hpp"
#include "mailclass/table.hpp"

namespace mailclass {

/**
 * Baseline that ignores content: picks a category at random, weighted by
 * how many messages were learned for it. Useful as a floor for crossval
 * accuracy.
 */
class TrivialClassifier : public Classifier {
public:
    explicit TrivialClassifier(const ClassifierOptions& options = ClassifierOptions{});

    ClassifierKind kind() const override { return ClassifierKind::Trivial; }

    bool is_valid(const Document&) const override { return true; }
    TokenSet parse(const Document&) const override { return {}; }

    void learn(const std::string& category, const Document& doc) override;
    void unlearn(const std::string& category, const Document& doc) override;

    // {UNK, 1} before anything is learned, otherwise one category with 1.
    Scores score(const Document& doc) override;

    void forget() override;
    bool empty() const override { return categories_.size() == 0; }

    std::unique_ptr<Classifier> clone() const override;
    void save(const std::string& path) const override;
    void restore(SnapshotReader& reader) override;

    uint64_t category_count(const std::string& category) const;

protected:
    void on_options_changed() override;

private:
    Table<uint64_t> categories_;
    std::mt19937 rng_;
    std::mutex rng_mutex_;
};

} // namespace mailclass
