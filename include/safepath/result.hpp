#pragma once

/**
 * @file result.hpp
 * @brief Error handling types shared by every fallible safepath operation
 *
 * Sanitization never throws. Operations that can fail return a Result<T>
 * holding either the value or an Error describing what was rejected.
 *
 * @example
 * ```cpp
 * auto r = safepath::sanitize_path("C:\\Users\\con.txt");
 * if (r.isOk()) {
 *     std::cout << r.value().path << "\n";   // "/C:/Users/_con_.txt"
 * } else {
 *     std::cerr << r.error().message() << "\n";
 * }
 * ```
 */

#include <optional>
#include <string>
#include <utility>

namespace safepath {

// ============================================================================
// Error Handling
// ============================================================================

/**
 * @brief Error codes for safepath operations
 */
enum class ErrorCode {
    // Sanitization failures
    UNSUPPORTED_PATH,   // long-UNC prefix
    CONTRADICTION,      // role hints inconsistent with each other or the text
    LENGTH_EXCEEDED,    // node longer than the limit, truncation disabled

    // Configuration
    POLICY_INVALID,
    IO_ERROR,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNSUPPORTED_PATH: return "UNSUPPORTED_PATH";
        case ErrorCode::CONTRADICTION: return "CONTRADICTION";
        case ErrorCode::LENGTH_EXCEEDED: return "LENGTH_EXCEEDED";
        case ErrorCode::POLICY_INVALID: return "POLICY_INVALID";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Error type with code and message
 */
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 *
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

    T valueOr(T default_value) const {
        if (has_value_) return value_.value();
        return default_value;
    }

    template<typename F>
    auto map(F func) const -> Result<decltype(func(std::declval<T>())), E> {
        if (has_value_) {
            return Result<decltype(func(std::declval<T>())), E>::ok(func(value_.value()));
        }
        return Result<decltype(func(std::declval<T>())), E>::err(error_.value());
    }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

} // namespace safepath
