#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by the fjp library
 *
 * Malformed profile text is never an error at this level: it is classified
 * into data (see ParseError and Content::Invalid). Error is reserved for the
 * collaborators that touch the filesystem (lookup, include expansion).
 */

#include <optional>
#include <string>
#include <utility>

namespace fjp {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    PROFILE_NOT_FOUND,
    INVALID_PROFILE_NAME,
    IO_ERROR,
    INCLUDE_DEPTH_EXCEEDED,
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PROFILE_NOT_FOUND: return "PROFILE_NOT_FOUND";
        case ErrorCode::INVALID_PROFILE_NAME: return "INVALID_PROFILE_NAME";
        case ErrorCode::IO_ERROR: return "IO_ERROR";
        case ErrorCode::INCLUDE_DEPTH_EXCEEDED: return "INCLUDE_DEPTH_EXCEEDED";
        default: return "UNKNOWN";
    }
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
    std::string toString() const { return message_; }

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
 * T and E may be the same type: Content::parse and ProfileStream::parse
 * return a fully built value on both paths and only the tag tells them apart.
 * Check isOk() before accessing value(), or isErr() before error().
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.has_value_ = true;
        r.value_.emplace(std::move(value));
        return r;
    }

    static Result err(E error) {
        Result r;
        r.has_value_ = false;
        r.error_.emplace(std::move(error));
        return r;
    }

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

    bool operator==(const Result& other) const {
        return has_value_ == other.has_value_ && value_ == other.value_ &&
               error_ == other.error_;
    }
    bool operator!=(const Result& other) const { return !(*this == other); }

private:
    Result() = default;

    bool has_value_ = false;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace fjp
