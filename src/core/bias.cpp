#include "mailclass/bias.hpp"

#include <cmath>
#include "mailclass/logging.hpp"

namespace mailclass {

double BiasTable::get(const std::string& category) const {
    return table_.get(category).value_or(kDefaultBias);
}

bool BiasTable::set(const std::string& category, double bias) {
    if (!(bias > 0.0) || !std::isfinite(bias)) {
        LOG_DEBUG("Ignoring bias ", bias, " for category '", category, "'");
        return false;
    }
    table_.put(category, bias);
    ++version_;
    return true;
}

std::map<std::string, double> BiasTable::resolve(const std::vector<std::string>& categories) const {
    auto guard = table_.read_lock();
    std::map<std::string, double> out;
    for (const auto& category : categories) {
        out[category] = table_.backend().get(category).value_or(kDefaultBias);
    }
    return out;
}

std::map<std::string, double> BiasTable::all() const {
    std::map<std::string, double> out;
    for (const auto& [category, bias] : table_.rows()) {
        out[category] = bias;
    }
    return out;
}

} // namespace mailclass
