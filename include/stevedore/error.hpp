#pragma once

#include <stdexcept>
#include <string>

namespace stevedore {

/**
 * Structured error reporting for stevedore.
 *
 * Every exception carries an ErrorCode plus optional context (usually the
 * function or statement that failed) and a recovery suggestion.
 */

enum class ErrorCode {
    // General errors
    INVALID_ARGUMENT = 1,

    // Database errors
    CONNECTION_FAILED = 100,
    QUERY_FAILED = 101,
    STATEMENT_TIMEOUT = 103,

    // Configuration errors
    CONFIG_INVALID = 200,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PARSE_FAILED = 301,

    // Internal errors
    INTERNAL_ERROR = 500
};

class StevedoreException : public std::runtime_error {
public:
    explicit StevedoreException(ErrorCode code, const std::string& message,
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
        std::string result = "stevedore error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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

// Convenience exception types
class InvalidArgumentError : public StevedoreException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : StevedoreException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class DatabaseError : public StevedoreException {
public:
    explicit DatabaseError(const std::string& message,
                           const std::string& sqlstate = "",
                           const std::string& context = "",
                           ErrorCode code = ErrorCode::QUERY_FAILED)
        : StevedoreException(code, message, context)
        , sqlstate_(sqlstate) {}

    const std::string& sqlstate() const noexcept { return sqlstate_; }

private:
    std::string sqlstate_;
};

/**
 * The statement ran past its deadline and Postgres cancelled it
 * (SQLSTATE 57014). Workers report this as a Timeout outcome rather
 * than an Error, so policies can escalate or split instead of retrying.
 */
class StatementTimeout : public DatabaseError {
public:
    static constexpr const char* SQLSTATE = "57014";

    explicit StatementTimeout(const std::string& message,
                              const std::string& context = "")
        : DatabaseError(message, SQLSTATE, context, ErrorCode::STATEMENT_TIMEOUT) {}
};

class ConfigError : public StevedoreException {
public:
    explicit ConfigError(const std::string& message,
                         const std::string& context = "",
                         const std::string& suggestion = "")
        : StevedoreException(ErrorCode::CONFIG_INVALID, message, context, suggestion) {}
};

class IOError : public StevedoreException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     ErrorCode code = ErrorCode::FILE_NOT_FOUND)
        : StevedoreException(code, message, context) {}
};

class ErrorHandler {
public:
    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define STEVEDORE_CHECK_ARGUMENT(condition, message) \
    stevedore::ErrorHandler::check_argument(condition, message, __func__)

} // namespace stevedore
