#pragma once

#include <stdexcept>
#include <string>

namespace polarity {

/**
 * Structured error reporting for the engine.
 * Every exception carries the failed constraint and the caller-facing context.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,

    // Validation errors
    EMPTY_INPUT = 10,
    INPUT_TOO_LONG = 11,
    VOCABULARY_EMPTY = 12,
    TOKEN_OUT_OF_RANGE = 13,
    LENGTH_MISMATCH = 14,
    VALUE_OUT_OF_RANGE = 15,

    // Collaborator errors
    PERMISSION_DENIED = 20,
    SUSPENDED = 21,

    // Database errors
    CONNECTION_FAILED = 100,
    QUERY_FAILED = 101,
    TRANSACTION_FAILED = 102,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PARSE_FAILED = 303
};

class PolarityException : public std::runtime_error {
public:
    explicit PolarityException(ErrorCode code, const std::string& message,
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
        std::string result = "Polarity error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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

// Rejected input. The call aborted before touching any state.
class ValidationError : public PolarityException {
public:
    explicit ValidationError(ErrorCode code, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "")
        : PolarityException(code, message, context, suggestion) {}
};

class PermissionError : public PolarityException {
public:
    explicit PermissionError(const std::string& message,
                             const std::string& context = "")
        : PolarityException(ErrorCode::PERMISSION_DENIED, message, context) {}
};

class SuspendedError : public PolarityException {
public:
    explicit SuspendedError(const std::string& context = "")
        : PolarityException(ErrorCode::SUSPENDED, "Engine is paused", context,
                            "Resubmit the call after the engine is unpaused") {}
};

class DatabaseError : public PolarityException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& context = "",
                           ErrorCode code = ErrorCode::QUERY_FAILED)
        : PolarityException(code, message, context) {}
};

class IOError : public PolarityException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : PolarityException(code, message, context) {}
};

// Macros for common error checking
#define POLARITY_CHECK(condition, code, message) \
    do { if (!(condition)) throw polarity::ValidationError(code, message, __func__); } while (0)

#define POLARITY_CHECK_ARGUMENT(condition, message) \
    POLARITY_CHECK(condition, polarity::ErrorCode::VALUE_OUT_OF_RANGE, message)

} // namespace polarity
