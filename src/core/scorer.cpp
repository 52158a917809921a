#include "mailclass/scorer.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include "mailclass/logging.hpp"

namespace mailclass {

RefreshParams refresh_params(const ClassifierOptions& options) {
    RefreshParams params;
    params.min_observations = options.n_observations_required;
    params.min_probability = options.minimum_word_prob;
    params.max_probability = options.maximum_word_prob;
    return params;
}

Scorer::Scorer(FrequencyStore& store, const BiasTable& bias, PredictorCache& cache,
               const ClassifierOptions& options)
    : store_(store)
    , bias_(bias)
    , cache_(cache)
    , options_(options)
    , combiner_(make_combiner(options.combiner)) {}

bool Scorer::refresh_if_stale() {
    if (!cache_.refresh_if_stale(store_, bias_, refresh_params(options_), options_.score_delay)) {
        return false;
    }
    LOG_TRACE(options_.debug, Message, "Updated predictors after ",
              store_.meta().messages_scored_as_of(), " messages");
    return true;
}

Scores Scorer::score(const TokenSet& tokens, ScoreDetails* details) {
    refresh_if_stale();

    const std::vector<std::string> categories = store_.category_names();

    struct Candidate {
        const Token* token;
        const PredictorRecord* record;
        double significance;
    };

    const auto rows = cache_.lookup_all(tokens);
    std::vector<Candidate> candidates;
    candidates.reserve(rows.size());
    for (const auto& [token, record] : rows) {
        double significance = 0.0;
        for (const auto& category : categories) {
            auto it = record.find(category);
            if (it != record.end()) significance += it->second.significance;
        }
        candidates.push_back({&token, &record, significance});
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.significance != b.significance) return a.significance > b.significance;
        return *a.token < *b.token;
    });

    const size_t n_predictors = static_cast<size_t>(options_.effective_predictors());
    if (candidates.size() > n_predictors) {
        candidates.resize(n_predictors);
    }

    if (details) {
        details->words.clear();
        for (const auto& c : candidates) {
            details->words.push_back({*c.token, c.significance, *c.record});
        }
    }

    if (trace_enabled(options_.debug, TraceLevel::Score)) {
        for (const auto& c : candidates) {
            std::ostringstream line;
            line << std::fixed << std::setprecision(2);
            for (const auto& [category, predictor] : *c.record) {
                line << category << " " << predictor.probability << "  ";
            }
            LOG_INFO("Predictor ", *c.token, ": ", line.str());
        }
    }

    Scores scores;
    scores.reserve(categories.size());
    for (const auto& category : categories) {
        std::vector<double> probabilities;
        probabilities.reserve(candidates.size());
        for (const auto& c : candidates) {
            auto it = c.record->find(category);
            if (it != c.record->end()) probabilities.push_back(it->second.probability);
        }
        scores.push_back({category, combiner_->combine(probabilities)});
    }

    std::stable_sort(scores.begin(), scores.end(), [](const CategoryScore& a, const CategoryScore& b) {
        return a.probability > b.probability;
    });
    return scores;
}

} // namespace mailclass
