#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "mailclass/table.hpp"
#include "mailclass/types.hpp"

namespace mailclass {

/**
 * Staleness counters of the predictor cache relative to the counts.
 *
 * Both counters only ever grow until reset(); messages_processed is bumped
 * by learn and unlearn alike.
 */
class CacheMeta {
public:
    uint64_t messages_processed() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return processed_;
    }

    uint64_t messages_scored_as_of() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return scored_;
    }

    uint64_t staleness() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return processed_ - scored_;
    }

    void note_processed() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        ++processed_;
    }

    // Record that the cache reflects every message up to `as_of`.
    void mark_scored(uint64_t as_of) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (as_of > processed_) as_of = processed_;
        if (as_of > scored_) scored_ = as_of;
    }

    void reset() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        reset_unlocked();
    }

    void reset_unlocked() { processed_ = scored_ = 0; }

    // Caller holds mutex().
    uint64_t processed_unlocked() const { return processed_; }
    uint64_t scored_unlocked() const { return scored_; }

    void restore_unlocked(uint64_t processed, uint64_t scored) {
        processed_ = processed;
        scored_ = scored < processed ? scored : processed;
    }

    std::shared_mutex& mutex() const { return mutex_; }

private:
    uint64_t processed_ = 0;
    uint64_t scored_ = 0;
    mutable std::shared_mutex mutex_;
};

/**
 * Per-category message counts and per-token per-category occurrence counts.
 *
 * The word table lives on disk when constructed with on_disk; the category
 * table is always in memory. learn/unlearn take both write locks together so
 * that snapshot() always sees counts and message totals that agree.
 */
class FrequencyStore {
public:
    struct Snapshot {
        std::map<std::string, uint64_t> categories;
        std::vector<Table<CountRecord>::Row> words;
        uint64_t messages_processed = 0;
    };

    explicit FrequencyStore(bool on_disk = false);

    // Both throw ConfigurationError for the reserved or an empty category.
    void learn(const std::string& category, const TokenSet& tokens);
    void unlearn(const std::string& category, const TokenSet& tokens);

    void forget();

    uint64_t category_count(const std::string& category) const;
    std::map<std::string, uint64_t> categories() const;
    std::vector<std::string> category_names() const;

    std::optional<CountRecord> counts(const Token& token) const;
    uint64_t count(const Token& token, const std::string& category) const;
    size_t vocabulary_size() const;

    Snapshot snapshot() const;

    CacheMeta& meta() { return meta_; }
    const CacheMeta& meta() const { return meta_; }

    Table<uint64_t>& category_table() { return categories_; }
    const Table<uint64_t>& category_table() const { return categories_; }
    Table<CountRecord>& word_table() { return words_; }
    const Table<CountRecord>& word_table() const { return words_; }

    static void check_category(const std::string& category);

private:
    Table<uint64_t> categories_;
    Table<CountRecord> words_;
    CacheMeta meta_;
};

} // namespace mailclass
