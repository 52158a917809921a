#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "mailclass/bias.hpp"
#include "mailclass/frequency_store.hpp"
#include "mailclass/table.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

struct RefreshParams {
    int64_t min_observations = 5;
    double min_probability = 0.01;
    double max_probability = 0.99;
};

/**
 * Cached per-token, per-category (probability, significance) pairs.
 *
 * A token's probability for category c is its bias-weighted relative
 * frequency in c normalised by the sum over all categories:
 *
 *              count[c] / messages[c] * bias[c]
 *     p(c) = ------------------------------------
 *             sum_k count[k] / messages[k] * bias[k]
 *
 * clamped into [min, max]. This is Graham's two-category ratio generalised
 * to N categories. The cache is only ever rebuilt as a whole, one rebuild at
 * a time, so an older rebuild can never replace a newer one.
 */
class PredictorCache {
public:
    using Row = Table<PredictorRecord>::Row;

    explicit PredictorCache(bool on_disk = false);

    /**
     * Rebuild from the current counts. Counts are copied under read locks,
     * records are computed without holding any lock, and the cache's write
     * lock is only held while the new content is swapped in.
     *
     * @return number of tokens admitted
     */
    size_t refresh(FrequencyStore& store, const BiasTable& bias, const RefreshParams& params);

    /**
     * Rebuild when score_delay messages were processed or a bias changed
     * since the last rebuild. Rebuilds are serialized and staleness is
     * checked again once the previous rebuild has finished, so concurrent
     * scorers rebuild once.
     *
     * @return true if this call rebuilt the cache
     */
    bool refresh_if_stale(FrequencyStore& store, const BiasTable& bias, const RefreshParams& params,
                          int64_t score_delay);

    bool needs_refresh(const CacheMeta& meta, const BiasTable& bias, int64_t score_delay) const;

    std::optional<PredictorRecord> lookup(const Token& token) const;

    // Records of every cached token in `tokens`, taken under one read lock.
    std::vector<Row> lookup_all(const TokenSet& tokens) const;

    size_t size() const { return table_.size(); }
    void clear() { table_.clear(); }

    Table<PredictorRecord>& table() { return table_; }
    const Table<PredictorRecord>& table() const { return table_; }

    static bool is_stale(const CacheMeta& meta, int64_t score_delay);

    // Predictor record of one token, or nullopt when it is not admitted.
    static std::optional<PredictorRecord> compute(const CountRecord& counts,
                                                  const std::map<std::string, uint64_t>& categories,
                                                  const std::map<std::string, double>& bias,
                                                  const RefreshParams& params);

private:
    // Caller holds refresh_mutex_.
    size_t rebuild(FrequencyStore& store, const BiasTable& bias, const RefreshParams& params);

    Table<PredictorRecord> table_;
    std::mutex refresh_mutex_;
    std::atomic<uint64_t> built_bias_version_{0};
};

} // namespace mailclass
