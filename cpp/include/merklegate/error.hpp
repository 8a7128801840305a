#pragma once

#include <stdexcept>
#include <string>

namespace merklegate {

/**
 * Structured error reporting for the commitment pipeline.
 *
 * Per-record problems (bad format, empty line, duplicate) are never thrown;
 * they are collected as RejectionRecord values. Exceptions are reserved for
 * conditions that abort a build run.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_IMPLEMENTED = 3,

    // Input errors
    EMPTY_INPUT = 100,
    NO_VALID_IDENTIFIERS = 101,
    MALFORMED_ARTIFACT = 102,

    // Tree errors
    PROOF_VERIFICATION_FAILED = 200,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PERMISSION_DENIED = 301,
    WRITE_FAILED = 302,

    // Internal errors
    INTERNAL_ERROR = 500
};

const char* error_code_name(ErrorCode code) noexcept;

class MerklegateException : public std::runtime_error {
public:
    explicit MerklegateException(ErrorCode code, const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = std::string("merklegate error [") + error_code_name(code) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public MerklegateException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : MerklegateException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Input text that cannot produce a tree at all
class InputError : public MerklegateException {
public:
    explicit InputError(ErrorCode code, const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : MerklegateException(code, message, context, suggestion) {}
};

// Builder and verifier disagree; never caused by bad input data
class VerificationError : public MerklegateException {
public:
    explicit VerificationError(const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : MerklegateException(ErrorCode::PROOF_VERIFICATION_FAILED, message, context, suggestion) {}
};

class IOError : public MerklegateException {
public:
    explicit IOError(ErrorCode code, const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : MerklegateException(code, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw MerklegateException(code, message, context, suggestion);
        }
    }
};

// Macros for common error checking
#define MERKLEGATE_CHECK(condition, code, message) \
    merklegate::ErrorHandler::check_condition(condition, code, message, __func__)

#define MERKLEGATE_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw merklegate::InvalidArgumentError(message, __func__); } while (0)

#define MERKLEGATE_THROW(code, message) \
    throw merklegate::MerklegateException(code, message, __func__)

} // namespace merklegate
