#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "mailclass/table.hpp"

namespace mailclass {

/**
 * Per-category multiplier applied to observation ratios (default 1).
 *
 * Non-positive values are ignored: set() returns false and the stored value
 * stays whatever it was. Every accepted change bumps version(), which the
 * predictor cache compares against the version it was built with.
 */
class BiasTable {
public:
    static constexpr double kDefaultBias = 1.0;

    BiasTable() : table_("bias", false) {}

    double get(const std::string& category) const;
    bool set(const std::string& category, double bias);

    // Bias of every listed category, defaults filled in.
    std::map<std::string, double> resolve(const std::vector<std::string>& categories) const;
    std::map<std::string, double> all() const;

    void clear() {
        table_.clear();
        ++version_;
    }

    uint64_t version() const { return version_.load(); }

    Table<double>& table() { return table_; }
    const Table<double>& table() const { return table_; }

private:
    Table<double> table_;
    std::atomic<uint64_t> version_{0};
};

} // namespace mailclass
