#include "mailclass/predictor_cache.hpp"

#include <algorithm>
#include <chrono>
#include "mailclass/logging.hpp"

namespace mailclass {

PredictorCache::PredictorCache(bool on_disk)
    : table_("word_score", on_disk) {}

bool PredictorCache::is_stale(const CacheMeta& meta, int64_t score_delay) {
    uint64_t delay = score_delay > 0 ? static_cast<uint64_t>(score_delay) : 0;
    return meta.staleness() >= delay;
}

std::optional<PredictorRecord> PredictorCache::compute(const CountRecord& counts,
                                                       const std::map<std::string, uint64_t>& categories,
                                                       const std::map<std::string, double>& bias,
                                                       const RefreshParams& params) {
    std::map<std::string, double> ratios;
    double ratio_sum = 0.0;
    uint64_t n_obs = 0;

    for (const auto& [category, count] : counts) {
        n_obs += count;
        auto messages = categories.find(category);
        if (messages == categories.end() || messages->second == 0) continue;

        auto b = bias.find(category);
        double weight = b == bias.end() ? 1.0 : b->second;
        double ratio = static_cast<double>(count) / static_cast<double>(messages->second) * weight;
        ratios[category] = ratio;
        ratio_sum += ratio;
    }

    if (params.min_observations > 0 && n_obs < static_cast<uint64_t>(params.min_observations)) {
        return std::nullopt;
    }
    if (!(ratio_sum > 0.0)) {
        return std::nullopt;
    }

    PredictorRecord record;
    for (const auto& entry : categories) {
        const std::string& category = entry.first;
        auto it = ratios.find(category);
        double p = it == ratios.end() ? 0.0 : it->second / ratio_sum;
        p = std::clamp(p, params.min_probability, params.max_probability);
        record[category] = Predictor{p, p * p};
    }
    return record;
}

bool PredictorCache::needs_refresh(const CacheMeta& meta, const BiasTable& bias, int64_t score_delay) const {
    return is_stale(meta, score_delay) || bias.version() != built_bias_version_.load();
}

size_t PredictorCache::refresh(FrequencyStore& store, const BiasTable& bias, const RefreshParams& params) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return rebuild(store, bias, params);
}

bool PredictorCache::refresh_if_stale(FrequencyStore& store, const BiasTable& bias,
                                      const RefreshParams& params, int64_t score_delay) {
    if (!needs_refresh(store.meta(), bias, score_delay)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (!needs_refresh(store.meta(), bias, score_delay)) {
        return false;
    }
    rebuild(store, bias, params);
    return true;
}

size_t PredictorCache::rebuild(FrequencyStore& store, const BiasTable& bias, const RefreshParams& params) {
    auto start = std::chrono::steady_clock::now();

    FrequencyStore::Snapshot snap = store.snapshot();

    std::vector<std::string> names;
    names.reserve(snap.categories.size());
    for (const auto& entry : snap.categories) names.push_back(entry.first);
    // Read before resolving: a bias set in between only costs one more rebuild.
    const uint64_t bias_version = bias.version();
    const std::map<std::string, double> weights = bias.resolve(names);

    const long long n = static_cast<long long>(snap.words.size());
    std::vector<std::optional<PredictorRecord>> computed(snap.words.size());

    #pragma omp parallel for schedule(static)
    for (long long i = 0; i < n; ++i) {
        computed[i] = compute(snap.words[i].second, snap.categories, weights, params);
    }

    std::vector<Row> rows;
    rows.reserve(snap.words.size());
    for (size_t i = 0; i < computed.size(); ++i) {
        if (computed[i]) {
            rows.emplace_back(std::move(snap.words[i].first), std::move(*computed[i]));
        }
    }

    table_.replace_all(rows);
    store.meta().mark_scored(snap.messages_processed);
    built_bias_version_ = bias_version;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    LOG_DEBUG("Updated predictors after ", snap.messages_processed, " messages: ",
              rows.size(), " of ", snap.words.size(), " tokens admitted in ", elapsed, " ms");
    return rows.size();
}

std::optional<PredictorRecord> PredictorCache::lookup(const Token& token) const {
    return table_.get(token);
}

std::vector<PredictorCache::Row> PredictorCache::lookup_all(const TokenSet& tokens) const {
    auto guard = table_.read_lock();
    std::vector<Row> out;
    for (const auto& token : tokens) {
        if (auto record = table_.backend().get(token)) {
            out.emplace_back(token, std::move(*record));
        }
    }
    return out;
}

} // namespace mailclass
