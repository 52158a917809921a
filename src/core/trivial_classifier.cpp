#include "mailclass/trivial_classifier.hpp"

#include <map>
#include "mailclass/frequency_store.hpp"
#include "mailclass/logging.hpp"
#include "mailclass/snapshot.hpp"

namespace mailclass {

TrivialClassifier::TrivialClassifier(const ClassifierOptions& options)
    : Classifier(options)
    , categories_("categories", false)
    , rng_(options.random_seed) {}

void TrivialClassifier::on_options_changed() {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    rng_.seed(options_.random_seed);
}

void TrivialClassifier::learn(const std::string& category, const Document& doc) {
    FrequencyStore::check_category(category);
    auto guard = categories_.lock();
    auto& backend = categories_.backend();
    backend.put(category, backend.get(category).value_or(0) + 1);
    LOG_TRACE(debug(), Flow, "Learning ", doc.id.empty() ? "message" : doc.id, " as ", category);
}

void TrivialClassifier::unlearn(const std::string& category, const Document& doc) {
    FrequencyStore::check_category(category);
    auto guard = categories_.lock();
    auto& backend = categories_.backend();
    if (auto n = backend.get(category); n && *n > 0) {
        backend.put(category, *n - 1);
    }
    LOG_TRACE(debug(), Flow, "Unlearning ", doc.id.empty() ? "message" : doc.id, " as ", category);
}

Scores TrivialClassifier::score(const Document&) {
    // Sorted so that a given seed always walks the categories in the same order.
    std::map<std::string, uint64_t> counts;
    uint64_t total = 0;
    for (const auto& [category, n] : categories_.rows()) {
        counts[category] = n;
        total += n;
    }
    if (total == 0) {
        return {{kUnknownCategory, 1.0}};
    }

    uint64_t pick;
    {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        pick = std::uniform_int_distribution<uint64_t>(0, total - 1)(rng_);
    }
    for (const auto& [category, n] : counts) {
        if (pick < n) return {{category, 1.0}};
        pick -= n;
    }
    return {{kUnknownCategory, 1.0}};
}

void TrivialClassifier::forget() {
    categories_.clear();
}

uint64_t TrivialClassifier::category_count(const std::string& category) const {
    return categories_.get(category).value_or(0);
}

std::unique_ptr<Classifier> TrivialClassifier::clone() const {
    auto copy = std::make_unique<TrivialClassifier>(options());
    copy->categories_.replace_all(categories_.rows());
    return copy;
}

void TrivialClassifier::save(const std::string& path) const {
    SnapshotWriter writer(classifier_kind_name(kind()));
    writer.write_options(options().to_config());
    {
        auto guard = categories_.read_lock();
        writer.write_table(categories_);
    }
    writer.commit(path);
}

void TrivialClassifier::restore(SnapshotReader& reader) {
    auto guard = categories_.lock();
    reader.read_table(categories_);
    reader.finish();
}

} // namespace mailclass
