#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include "mailclass/bias.hpp"
#include "mailclass/classifier.hpp"
#include "mailclass/frequency_store.hpp"
#include "mailclass/predictor_cache.hpp"
#include "mailclass/scorer.hpp"
#include "mailclass/tokenizer.hpp"

namespace mailclass {

/**
 * N-category Bayesian classifier.
 *
 * Counts tokens per category, turns them into per-token predictors on
 * demand and combines the most significant predictors of a message with
 * the configured combiner.
 *
 * Debug levels (see TraceLevel): 1 logs learning and scoring per message,
 * 5 logs predictor rebuilds, 10 logs the predictors used for each score,
 * 15 logs every token.
 */
class BayesClassifier : public Classifier {
public:
    // Exclusive locks on every table, taken together.
    using AllTablesLock = std::scoped_lock<std::shared_mutex, std::shared_mutex, std::shared_mutex,
                                           std::shared_mutex, std::shared_mutex>;

    explicit BayesClassifier(const ClassifierOptions& options = ClassifierOptions{});

    ClassifierKind kind() const override { return ClassifierKind::Bayes; }

    // A message is usable when it has at least one text/* part.
    bool is_valid(const Document& doc) const override;
    TokenSet parse(const Document& doc) const override;

    void learn(const std::string& category, const Document& doc) override;
    void unlearn(const std::string& category, const Document& doc) override;

    Scores score(const Document& doc) override;
    Scores score(const Document& doc, ScoreDetails& details);

    void forget() override;
    bool empty() const override;

    std::unique_ptr<Classifier> clone() const override;
    void save(const std::string& path) const override;
    void restore(SnapshotReader& reader) override;

    // Rebuild the predictor cache now, regardless of score_delay.
    size_t update_predictors();

    double bias(const std::string& category) const { return bias_.get(category); }
    // Returns false (and keeps the old value) for non-positive biases. An
    // accepted change is used by the next score without update_predictors().
    bool set_bias(const std::string& category, double value);
    std::map<std::string, double> biases() const { return bias_.all(); }

    AllTablesLock lock_all() const;

    FrequencyStore& store() { return store_; }
    const FrequencyStore& store() const { return store_; }
    PredictorCache& predictors() { return cache_; }
    const PredictorCache& predictors() const { return cache_; }

protected:
    void on_options_changed() override;

private:
    // Caller holds read_options().
    TokenSet tokenize(const Document& doc) const;

    TokenExtractor tokenizer_;
    FrequencyStore store_;
    BiasTable bias_;
    PredictorCache cache_;
    std::unique_ptr<Scorer> scorer_;
};

} // namespace mailclass
