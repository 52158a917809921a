#include "mailclass/config.hpp"

#include <chrono>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>

namespace mailclass {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); });
    auto end = std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

std::vector<std::string> Config::get_list(const std::string& key) const {
    std::vector<std::string> out;
    auto it = values_.find(key);
    if (it == values_.end()) return out;

    std::string current;
    for (char c : it->second) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) out.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

void Config::load_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ResourceError("Can't open config file '" + filename + "'", "Config::load_file");
    }

    std::string line;
    size_t loaded = 0;
    while (std::getline(file, line)) {
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        line = trim(line);
        if (line.empty()) continue;

        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            LOG_WARN("Ignoring config line without '=': ", line);
            continue;
        }
        std::string key = trim(line.substr(0, equals_pos));
        std::string value = trim(line.substr(equals_pos + 1));
        if (!key.empty()) {
            values_[key] = value;
            ++loaded;
        }
    }

    LOG_DEBUG("Loaded ", loaded, " options from ", filename);
}

void Config::save_file(const std::string& filename) const {
    std::ofstream file(filename, std::ios::trunc);
    if (!file.is_open()) {
        throw ResourceError("Can't open config file '" + filename + "' for writing", "Config::save_file");
    }

    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
    localtime_r(&now, &local_tm);
    file << "# mailclass options file created " << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "\n";
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    if (!file) {
        throw ResourceError("Failed writing config file '" + filename + "'", "Config::save_file");
    }
}

void init_logging_from_env() {
    const char* level_env = std::getenv("MAILCLASS_LOG_LEVEL");
    if (level_env && *level_env) {
        LogLevel level;
        if (parse_log_level(level_env, level)) {
            set_log_level(level);
        } else {
            LOG_WARN("Unknown log level '", level_env, "', keeping 'info'");
        }
    }

    const char* file_env = std::getenv("MAILCLASS_LOG_FILE");
    if (file_env && *file_env) {
        static std::ofstream log_stream(file_env, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", file_env);
        }
    }
}

} // namespace mailclass
