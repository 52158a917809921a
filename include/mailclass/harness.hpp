#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>
#include "mailclass/classifier.hpp"
#include "mailclass/confusion_matrix.hpp"
#include "mailclass/document.hpp"

namespace mailclass {

/**
 * Drives a classifier over labeled corpora: training, non-destructive
 * classification and N-fold cross-validation.
 *
 * Every entry point validates all of its arguments before touching the
 * classifier; a ConfigurationError therefore leaves the model as it was.
 */
class ClassifierHarness {
public:
    enum class State {
        Untrained,
        Trained
    };

    explicit ClassifierHarness(Classifier& classifier);

    State state() const { return state_; }
    Classifier& classifier() { return classifier_; }

    // Learn every valid document of every source. Returns the number learned.
    size_t train(const Corpus& corpus);

    // forget() followed by train().
    size_t retrain(const Corpus& corpus);

    void forget();

    // Score every valid document against the current model.
    ConfusionMatrix classify(double threshold, const Corpus& corpus);

    /**
     * N-fold cross-validation. Each document is assigned a fold drawn from
     * `rng`; for every fold the model is rebuilt from the other folds and
     * the held-out fold is scored. The classifier is left empty.
     */
    ConfusionMatrix crossval(int folds, double threshold, const Corpus& corpus, std::mt19937& rng);

    // Same, with a generator seeded from the classifier's random_seed.
    ConfusionMatrix crossval(int folds, double threshold, const Corpus& corpus);

    static void check_threshold(double threshold);
    static void check_folds(int folds);
    static void check_corpus(const Corpus& corpus);

private:
    // Category names of the corpus in first-seen order, without duplicates.
    static std::vector<std::string> corpus_categories(const Corpus& corpus);

    void tally(ConfusionMatrix& matrix, const std::string& actual, const Document& doc,
               double threshold);

    Classifier& classifier_;
    State state_;
};

} // namespace mailclass
