#pragma once

#include "padlock/common.hpp"
#include <stdexcept>
#include <string>
#include <variant>
#include <optional>

namespace padlock {

// Error codes for structured error handling
enum class ErrorCode {
    // Generic errors
    Success = 0,
    Unknown,
    InvalidArgument,
    OutOfRange,
    UnsupportedOption,

    // Cryptography errors
    CryptoInitFailed,
    AmbiguousInput,
    LengthMismatch,

    // Format / configuration errors
    InvalidFormat,
    ConfigLoadFailed,
    ConfigSaveFailed
};

// Convert error code to string
const char* error_code_to_string(ErrorCode code);

// Error class with structured information
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string details)
        : code_(code), message_(std::move(message)), details_(std::move(details)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }
    const std::string& details() const { return details_; }

    std::string to_string() const;

private:
    ErrorCode code_;
    std::string message_;
    std::string details_;
};

// Result type for error handling (similar to Rust's Result<T, E>)
template<typename T>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::move(value));
    }

    static Result Err(Error error) {
        return Result(std::move(error));
    }

    static Result Err(ErrorCode code, const std::string& message) {
        return Result(Error(code, message));
    }

    bool is_ok() const { return std::holds_alternative<T>(value_); }
    bool is_err() const { return std::holds_alternative<Error>(value_); }

    // Get the value (throws if error)
    T& value() {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    const T& value() const {
        if (is_err()) {
            throw std::runtime_error("Called value() on error Result: " + error().to_string());
        }
        return std::get<T>(value_);
    }

    // Get the error (throws if ok)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Called error() on ok Result");
        }
        return std::get<Error>(value_);
    }

    T value_or(T default_value) const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return default_value;
    }

    // Map the value if ok
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>()))> {
        using U = decltype(func(std::declval<T>()));
        if (is_ok()) {
            return Result<U>::Ok(func(value()));
        }
        return Result<U>::Err(error());
    }

    std::optional<T> ok() const {
        if (is_ok()) {
            return std::get<T>(value_);
        }
        return std::nullopt;
    }

private:
    explicit Result(T value) : value_(std::move(value)) {}
    explicit Result(Error error) : value_(std::move(error)) {}

    std::variant<T, Error> value_;
};

// Library exceptions. Every throw site carries an ErrorCode so callers can
// tell contract violations apart without parsing messages.
class PadlockException : public std::runtime_error {
public:
    PadlockException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    explicit PadlockException(const Error& error)
        : std::runtime_error(error.to_string()), code_(error.code()) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class CryptoException : public PadlockException {
public:
    CryptoException(ErrorCode code, const std::string& message)
        : PadlockException(code, "Crypto error: " + message) {}
};

class ConfigException : public PadlockException {
public:
    ConfigException(ErrorCode code, const std::string& message)
        : PadlockException(code, "Config error: " + message) {}
};

} // namespace padlock
