#include "mailclass/classifier.hpp"

#include <mutex>
#include "mailclass/bayes_classifier.hpp"
#include "mailclass/logging.hpp"
#include "mailclass/snapshot.hpp"
#include "mailclass/trivial_classifier.hpp"

namespace mailclass {

const char* classifier_kind_name(ClassifierKind kind) {
    switch (kind) {
        case ClassifierKind::Bayes: return "bayes";
        case ClassifierKind::Trivial: return "trivial";
    }
    return "unknown";
}

ClassifierKind parse_classifier_kind(const std::string& name) {
    if (name == "bayes") return ClassifierKind::Bayes;
    if (name == "trivial") return ClassifierKind::Trivial;
    throw ConfigurationError("Unknown classifier '" + name + "'", "parse_classifier_kind",
                             "Use 'bayes' or 'trivial'");
}

// =============================================================================
// Classifier
// =============================================================================

Classifier::Classifier(const ClassifierOptions& options)
    : options_(options) {
    options_.validate();
}

ClassifierOptions Classifier::options() const {
    auto guard = read_options();
    return options_;
}

int Classifier::debug() const {
    auto guard = read_options();
    return options_.debug;
}

void Classifier::set_config(const Config& config) {
    std::unique_lock<std::shared_mutex> guard(options_mutex_);
    Config merged = options_.to_config();
    merged.merge(config);
    ClassifierOptions updated = ClassifierOptions::from_config(merged);

    if (updated.on_disk != options_.on_disk) {
        LOG_WARN("on_disk can only be chosen when the classifier is created; keeping ",
                 options_.on_disk ? "disk" : "memory", " tables");
        updated.on_disk = options_.on_disk;
    }
    options_ = updated;
    on_options_changed();
}

void Classifier::load_config(const std::string& path) {
    Config config;
    config.load_file(path);
    set_config(config);
}

void Classifier::save_config(const std::string& path) const {
    options().to_config().save_file(path);
}

void Classifier::set_debug(int level) {
    Config config;
    config.set("debug", std::to_string(level));
    set_config(config);
}

// =============================================================================
// Factories
// =============================================================================

std::unique_ptr<Classifier> make_classifier(ClassifierKind kind, const ClassifierOptions& options) {
    switch (kind) {
        case ClassifierKind::Bayes: return std::make_unique<BayesClassifier>(options);
        case ClassifierKind::Trivial: return std::make_unique<TrivialClassifier>(options);
    }
    throw ConfigurationError("Unknown classifier kind", "make_classifier");
}

std::unique_ptr<Classifier> load_classifier(const std::string& path) {
    SnapshotReader reader(path);

    ClassifierKind kind;
    ClassifierOptions options;
    try {
        kind = parse_classifier_kind(reader.kind());
        options = ClassifierOptions::from_config(reader.read_options());
    } catch (const ConfigurationError& e) {
        throw CorruptSnapshotError(std::string("Invalid snapshot header: ") + e.what(), path);
    }

    auto classifier = make_classifier(kind, options);
    classifier->restore(reader);
    LOG_DEBUG("Loaded ", classifier_kind_name(kind), " classifier from ", path);
    return classifier;
}

} // namespace mailclass
