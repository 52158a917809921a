#pragma once

#include <cctype>
#include <iostream>
#include <string>
#include <chrono>
#include <cstring>
#include <ctime>
#include <sstream>
#include <iomanip>
#include <mutex>

namespace mailclass {

/**
 * Process-wide logging.
 *
 * Two independent gates apply. The logger's LogLevel (MAILCLASS_LOG_LEVEL,
 * -v / -q on the command line) filters what reaches the output stream. A
 * classifier's `debug` option selects how much of its own work it reports,
 * through LOG_TRACE at the TraceLevel steps below; traces are INFO records.
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// Steps of the `debug` classifier option.
enum class TraceLevel {
    Flow = 1,       // sources, folds, learn/unlearn, saves
    Message = 5,    // per-message results, predictor rebuilds
    Score = 10,     // predictors used for each score
    Token = 15      // every token of every parsed message
};

inline bool trace_enabled(int debug, TraceLevel level) {
    return debug >= static_cast<int>(level);
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, const char* file, int line, const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
        }

        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::stringstream msg;
        msg << "[" << ss.str() << "] " << level_str << " "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        *output_ << msg.str() << std::endl;
    }

private:
    Logger() : level_(LogLevel::INFO), output_(&std::clog) {}
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    LogLevel level_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

#define LOG_DEBUG(...) mailclass::Logger::getInstance().log(mailclass::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)  mailclass::Logger::getInstance().log(mailclass::LogLevel::INFO,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(...)  mailclass::Logger::getInstance().log(mailclass::LogLevel::WARN,  __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...) mailclass::Logger::getInstance().log(mailclass::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__)

// Report classifier work when its `debug` option reaches `level`, e.g.
// LOG_TRACE(options_.debug, Message, "Result: ", category).
#define LOG_TRACE(debug, level, ...) \
    do { \
        if (mailclass::trace_enabled((debug), mailclass::TraceLevel::level)) { \
            LOG_INFO(__VA_ARGS__); \
        } \
    } while (0)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Accepts "debug", "info", "warn" and "error" in any case; returns false otherwise.
inline bool parse_log_level(std::string name, LogLevel& out) {
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    return false;
}

} // namespace mailclass
