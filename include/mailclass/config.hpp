#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <type_traits>
#include <vector>
#include "mailclass/error.hpp"
#include "mailclass/logging.hpp"

namespace mailclass {

/**
 * String key/value option store.
 *
 * Values are kept as text and converted on access. Files use one
 * `key=value` pair per line; `#` starts a comment and surrounding
 * whitespace is ignored.
 */
class Config {
public:
    Config() = default;

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void set(const std::string& key, const std::string& value) {
        values_[key] = value;
    }

    void erase(const std::string& key) {
        values_.erase(key);
    }

    // Lenient lookup: unparsable values fall back to the default with a warning.
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        T out{};
        if (!convert(it->second, out)) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
        return out;
    }

    // Strict lookup: unparsable values raise ConfigurationError.
    template<typename T>
    T get_strict(const std::string& key, T default_value = T{}) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }
        T out{};
        if (!convert(it->second, out)) {
            throw ConfigurationError("Invalid value '" + it->second + "' for option '" + key + "'",
                                     "Config::get_strict");
        }
        return out;
    }

    // Comma and/or whitespace separated list.
    std::vector<std::string> get_list(const std::string& key) const;

    const std::map<std::string, std::string>& values() const { return values_; }

    // Throws ResourceError when the file cannot be opened.
    void load_file(const std::string& filename);
    void save_file(const std::string& filename) const;

    void merge(const Config& other) {
        for (const auto& [key, value] : other.values_) {
            values_[key] = value;
        }
    }

private:
    template<typename T>
    static bool convert(const std::string& text, T& out) {
        try {
            size_t used = 0;
            if constexpr (std::is_same_v<T, bool>) {
                std::string val = text;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                if (val == "true" || val == "1" || val == "yes" || val == "on") { out = true; return true; }
                if (val == "false" || val == "0" || val == "no" || val == "off" || val.empty()) { out = false; return true; }
                return false;
            } else if constexpr (std::is_same_v<T, int>) {
                out = std::stoi(text, &used);
            } else if constexpr (std::is_same_v<T, long long>) {
                out = std::stoll(text, &used);
            } else if constexpr (std::is_same_v<T, double>) {
                out = std::stod(text, &used);
            } else {
                out = text;
                return true;
            }
            while (used < text.size() && std::isspace(static_cast<unsigned char>(text[used]))) ++used;
            return used == text.size();
        } catch (const std::exception&) {
            return false;
        }
    }

    std::map<std::string, std::string> values_;
};

// Configure the process logger from MAILCLASS_LOG_LEVEL / MAILCLASS_LOG_FILE.
void init_logging_from_env();

} // namespace mailclass
