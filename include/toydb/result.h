// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  ToyDB - Result and Error Types                                              ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace toydb {

// ==============================================================================
// Error Handling
// ==============================================================================

/// Engine error codes
enum class ErrorCode : std::uint32_t {
    Success = 0,
    ParseError = 100,
    PredicateError = 101,
    UnsupportedOperator = 102,
    TableExists = 200,
    TableNotFound = 201,
    ColumnValueMismatch = 300,
    RowKeyError = 301,
    IoError = 400,
    InvalidArgument = 900,
    InternalError = 999,
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ParseError: return "Parse error";
        case ErrorCode::PredicateError: return "Predicate error";
        case ErrorCode::UnsupportedOperator: return "Unsupported operator";
        case ErrorCode::TableExists: return "Table exists";
        case ErrorCode::TableNotFound: return "Table not found";
        case ErrorCode::ColumnValueMismatch: return "Column/value mismatch";
        case ErrorCode::RowKeyError: return "Row key error";
        case ErrorCode::IoError: return "I/O Error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/// Engine error with context
class Error {
public:
    Error() noexcept : code_(ErrorCode::Success) {}

    explicit Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string message) noexcept
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] bool ok() const noexcept { return code_ == ErrorCode::Success; }
    [[nodiscard]] explicit operator bool() const noexcept { return !ok(); }

    [[nodiscard]] std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_to_string(code_));
        }
        return std::string(error_code_to_string(code_)) + ": " + message_;
    }

private:
    ErrorCode code_;
    std::string message_;
};

// ==============================================================================
// Result<T>
// ==============================================================================

/// Tag type for constructing error result
struct ErrorTag {};
inline constexpr ErrorTag error_tag{};

/// Result type for operations that can fail
template<typename T>
class Result {
public:
    using value_type = T;
    using error_type = Error;

    // Success constructors
    Result(const T& value) : storage_(value), has_value_(true) {}
    Result(T&& value) : storage_(std::move(value)), has_value_(true) {}

    // Error constructors
    Result(ErrorTag, const Error& err) : storage_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : storage_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : storage_(Error(code, std::move(msg))), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] T& value() & {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value_) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return std::get<Error>(storage_);
    }

    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }

private:
    std::variant<T, Error> storage_;
    bool has_value_;
};

// ==============================================================================
// Result<void> specialization
// ==============================================================================

template<>
class Result<void> {
public:
    using value_type = void;
    using error_type = Error;

    Result() : error_(), has_value_(true) {}

    Result(ErrorTag, const Error& err) : error_(err), has_value_(false) {}
    Result(ErrorTag, Error&& err) : error_(std::move(err)), has_value_(false) {}
    Result(ErrorTag, ErrorCode code, std::string msg)
        : error_(code, std::move(msg)), has_value_(false) {}

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    void value() const {
        if (!has_value_) throw std::runtime_error("Result has no value");
    }

    [[nodiscard]] const Error& error() const& {
        if (has_value_) throw std::runtime_error("Result has value, not error");
        return error_;
    }

private:
    Error error_;
    bool has_value_;
};

/// Status is an alias for Result<void>
using Status = Result<void>;

// ==============================================================================
// Factory functions
// ==============================================================================

/// Create success status (void result)
[[nodiscard]] inline Status Ok() {
    return Status();
}

template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(error_tag, code, std::move(message));
}

template<typename T>
[[nodiscard]] Result<T> Err(const Error& error) {
    return Result<T>(error_tag, error);
}

[[nodiscard]] inline Status Err(ErrorCode code, std::string message) {
    return Status(error_tag, code, std::move(message));
}

[[nodiscard]] inline Status Err(const Error& error) {
    return Status(error_tag, error);
}

} // namespace toydb
