#include "mailclass/harness.hpp"

#include <algorithm>
#include <chrono>
#include "mailclass/error.hpp"
#include "mailclass/frequency_store.hpp"
#include "mailclass/logging.hpp"

namespace mailclass {

ClassifierHarness::ClassifierHarness(Classifier& classifier)
    : classifier_(classifier)
    , state_(classifier.empty() ? State::Untrained : State::Trained) {}

// =============================================================================
// Validation
// =============================================================================

void ClassifierHarness::check_threshold(double threshold) {
    MAILCLASS_CHECK_CONFIG(threshold >= 0.0 && threshold <= 1.0, "Threshold must be in [0,1]");
}

void ClassifierHarness::check_folds(int folds) {
    MAILCLASS_CHECK_CONFIG(folds >= 2, "Can't crossval with less than 2 folds");
}

void ClassifierHarness::check_corpus(const Corpus& corpus) {
    for (const auto& entry : corpus) {
        MAILCLASS_CHECK_CONFIG(entry.source != nullptr,
                               "Corpus entry for category '" + entry.category + "' has no source");
        FrequencyStore::check_category(entry.category);
    }
}

std::vector<std::string> ClassifierHarness::corpus_categories(const Corpus& corpus) {
    std::vector<std::string> categories;
    for (const auto& entry : corpus) {
        if (std::find(categories.begin(), categories.end(), entry.category) == categories.end()) {
            categories.push_back(entry.category);
        }
    }
    return categories;
}

// =============================================================================
// Training
// =============================================================================

size_t ClassifierHarness::train(const Corpus& corpus) {
    check_corpus(corpus);

    size_t learned = 0;
    for (const auto& entry : corpus) {
        const std::vector<Document> docs = entry.source->documents();
        LOG_TRACE(classifier_.debug(), Flow, docs.size(), " messages in ", entry.source->name());
        for (const auto& doc : docs) {
            if (!classifier_.is_valid(doc)) continue;
            classifier_.learn(entry.category, doc);
            ++learned;
            state_ = State::Trained;
        }
    }
    LOG_DEBUG("Trained on ", learned, " documents from ", corpus.size(), " sources");
    return learned;
}

size_t ClassifierHarness::retrain(const Corpus& corpus) {
    check_corpus(corpus);
    forget();
    return train(corpus);
}

void ClassifierHarness::forget() {
    classifier_.forget();
    state_ = State::Untrained;
}

// =============================================================================
// Evaluation
// =============================================================================

void ClassifierHarness::tally(ConfusionMatrix& matrix, const std::string& actual,
                              const Document& doc, double threshold) {
    const Scores scores = classifier_.score(doc);
    if (!scores.empty() && scores.front().probability >= threshold) {
        matrix.add(actual, scores.front().category);
    } else {
        matrix.add(actual, kUnknownCategory);
    }
    if (!scores.empty()) {
        LOG_TRACE(classifier_.debug(), Message, "Result: ", scores.front().category, ",",
                  scores.front().probability);
    }
}

ConfusionMatrix ClassifierHarness::classify(double threshold, const Corpus& corpus) {
    check_threshold(threshold);
    check_corpus(corpus);

    ConfusionMatrix matrix(corpus_categories(corpus));
    for (const auto& entry : corpus) {
        for (const auto& doc : entry.source->documents()) {
            if (!classifier_.is_valid(doc)) continue;
            tally(matrix, entry.category, doc, threshold);
        }
    }
    return matrix;
}

ConfusionMatrix ClassifierHarness::crossval(int folds, double threshold, const Corpus& corpus,
                                            std::mt19937& rng) {
    check_folds(folds);
    check_threshold(threshold);
    check_corpus(corpus);

    auto start = std::chrono::steady_clock::now();

    // Every document of every source, tagged with its fold.
    struct Tagged {
        Document doc;
        int fold;
    };
    std::vector<std::vector<Tagged>> sources;
    sources.reserve(corpus.size());
    std::uniform_int_distribution<int> pick_fold(0, folds - 1);
    for (const auto& entry : corpus) {
        std::vector<Document> docs = entry.source->documents();
        LOG_TRACE(classifier_.debug(), Flow, docs.size(), " messages in ", entry.source->name());
        std::vector<Tagged> tagged;
        tagged.reserve(docs.size());
        for (auto& doc : docs) {
            tagged.push_back({std::move(doc), pick_fold(rng)});
        }
        sources.push_back(std::move(tagged));
    }

    ConfusionMatrix matrix(corpus_categories(corpus));
    for (int fold = 0; fold < folds; ++fold) {
        LOG_TRACE(classifier_.debug(), Flow, "Training without fold ", fold + 1);
        classifier_.forget();
        for (size_t s = 0; s < corpus.size(); ++s) {
            for (const auto& item : sources[s]) {
                if (item.fold == fold || !classifier_.is_valid(item.doc)) continue;
                classifier_.learn(corpus[s].category, item.doc);
            }
        }

        LOG_TRACE(classifier_.debug(), Flow, "Scoring fold ", fold + 1);
        for (size_t s = 0; s < corpus.size(); ++s) {
            for (const auto& item : sources[s]) {
                if (item.fold != fold || !classifier_.is_valid(item.doc)) continue;
                tally(matrix, corpus[s].category, item.doc, threshold);
            }
        }
    }

    classifier_.forget();
    state_ = State::Untrained;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    LOG_DEBUG("Cross-validated ", matrix.total(), " documents in ", folds, " folds (",
              elapsed.count(), " ms)");
    return matrix;
}

ConfusionMatrix ClassifierHarness::crossval(int folds, double threshold, const Corpus& corpus) {
    std::mt19937 rng(classifier_.options().random_seed);
    return crossval(folds, threshold, corpus, rng);
}

} // namespace mailclass
