#pragma once

#include <memory>
#include "mailclass/bias.hpp"
#include "mailclass/combiner.hpp"
#include "mailclass/frequency_store.hpp"
#include "mailclass/options.hpp"
#include "mailclass/predictor_cache.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Scores a token set against the predictor cache.
 *
 * The most significant tokens (sum of squared per-category probabilities)
 * become the evidence; equally significant tokens are taken in lexical order.
 * Each category's probabilities are folded by the configured combiner.
 */
class Scorer {
public:
    Scorer(FrequencyStore& store, const BiasTable& bias, PredictorCache& cache,
           const ClassifierOptions& options);

    // Rebuild the cache when score_delay messages have been processed or a
    // bias changed since the last rebuild. Returns true if this call rebuilt.
    bool refresh_if_stale();

    // Scores sorted descending; equal scores ordered by category name.
    Scores score(const TokenSet& tokens, ScoreDetails* details = nullptr);

    const Combiner& combiner() const { return *combiner_; }

private:
    FrequencyStore& store_;
    const BiasTable& bias_;
    PredictorCache& cache_;
    // The owning classifier keeps these unchanged while score() runs.
    const ClassifierOptions& options_;
    std::unique_ptr<Combiner> combiner_;
};

RefreshParams refresh_params(const ClassifierOptions& options);

} // namespace mailclass
