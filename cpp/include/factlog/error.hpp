#pragma once

#include <stdexcept>
#include <string>

namespace factlog {

/**
 * Structured error reporting for the fact log.
 * Every error carries a code, the failing function as context and an
 * optional hint for the operator.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Store errors
    STORE_UNAVAILABLE = 100,

    // Data integrity errors
    MALFORMED_FACT_GROUP = 200,

    // Configuration errors
    CONFIG_INVALID = 300
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::STORE_UNAVAILABLE:    return "STORE_UNAVAILABLE";
        case ErrorCode::MALFORMED_FACT_GROUP: return "MALFORMED_FACT_GROUP";
        case ErrorCode::CONFIG_INVALID:       return "CONFIG_INVALID";
    }
    return "UNKNOWN";
}

class FactlogException : public std::runtime_error {
public:
    explicit FactlogException(ErrorCode code, const std::string& message,
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
        std::string result = std::string("factlog error [") + error_code_name(code) + "]: " + message;
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

class InvalidArgumentError : public FactlogException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : FactlogException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// The fact fetch failed. Never retried inside the library.
class StoreUnavailableError : public FactlogException {
public:
    explicit StoreUnavailableError(const std::string& message,
                                   const std::string& context = "",
                                   const std::string& suggestion = "")
        : FactlogException(ErrorCode::STORE_UNAVAILABLE, message, context, suggestion) {}
};

// A transaction group broke the single-assertion-per-attribute invariant
class MalformedFactGroupError : public FactlogException {
public:
    explicit MalformedFactGroupError(const std::string& message,
                                     const std::string& context = "",
                                     const std::string& suggestion = "")
        : FactlogException(ErrorCode::MALFORMED_FACT_GROUP, message, context, suggestion) {}
};

class ConfigError : public FactlogException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : FactlogException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

#define FACTLOG_THROW(ErrorType, message) \
    throw factlog::ErrorType(message, __func__)

#define FACTLOG_THROW_HINT(ErrorType, message, suggestion) \
    throw factlog::ErrorType(message, __func__, suggestion)

#define FACTLOG_CHECK_ARGUMENT(condition, message) \
    do { \
        if (!(condition)) FACTLOG_THROW(InvalidArgumentError, message); \
    } while (0)

} // namespace factlog
