#pragma once

#include <stdexcept>
#include <string>

namespace mailclass {

/**
 * Structured error reporting for the classifier.
 *
 * Configuration problems are raised before any state is touched. Resource
 * problems abort the current operation; work already applied by that
 * operation is kept.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Caller supplied settings
    CONFIGURATION_ERROR = 100,
    RESERVED_CATEGORY = 101,

    // Files and document sources
    RESOURCE_ERROR = 300,
    CORRUPT_SNAPSHOT = 301,

    INTERNAL_ERROR = 500
};

class MailclassException : public std::runtime_error {
public:
    explicit MailclassException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "mailclass error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class ConfigurationError : public MailclassException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : MailclassException(ErrorCode::CONFIGURATION_ERROR, message, context, suggestion) {}

protected:
    ConfigurationError(ErrorCode code, const std::string& message,
                       const std::string& context, const std::string& suggestion)
        : MailclassException(code, message, context, suggestion) {}
};

class ReservedCategoryError : public ConfigurationError {
public:
    explicit ReservedCategoryError(const std::string& category,
                                   const std::string& context = "")
        : ConfigurationError(ErrorCode::RESERVED_CATEGORY,
                             "Can't accept reserved category '" + category + "'",
                             context, "Pick another category name") {}
};

class ResourceError : public MailclassException {
public:
    explicit ResourceError(const std::string& message,
                           const std::string& context = "",
                           const std::string& suggestion = "")
        : MailclassException(ErrorCode::RESOURCE_ERROR, message, context, suggestion) {}

protected:
    ResourceError(ErrorCode code, const std::string& message,
                  const std::string& context, const std::string& suggestion)
        : MailclassException(code, message, context, suggestion) {}
};

class CorruptSnapshotError : public ResourceError {
public:
    explicit CorruptSnapshotError(const std::string& message,
                                  const std::string& context = "")
        : ResourceError(ErrorCode::CORRUPT_SNAPSHOT, message, context, "") {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw MailclassException(code, message, context, suggestion);
        }
    }

    static void check_configuration(bool condition, const std::string& message,
                                    const std::string& context = "") {
        if (!condition) {
            throw ConfigurationError(message, context);
        }
    }
};

#define MAILCLASS_CHECK(condition, code, message) \
    mailclass::ErrorHandler::check_condition(condition, code, message, __func__)

#define MAILCLASS_CHECK_CONFIG(condition, message) \
    mailclass::ErrorHandler::check_configuration(condition, message, __func__)

#define MAILCLASS_THROW(code, message) \
    throw mailclass::MailclassException(code, message, __func__)

#define MAILCLASS_THROW_RESOURCE(message) \
    throw mailclass::ResourceError(message, __func__)

} // namespace mailclass
