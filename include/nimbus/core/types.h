#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace nimbus {

// Type aliases
using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidState,
    NotFound,
    AlreadyExists,
    TransientNetworkError,
    AuthorizationError,
    ResourceLimitExceeded,
    RegistrationTimeout,
    InvariantViolation,
    Timeout,
    OperationInProgress,
    OperationCancelled,
    PreconditionFailed,
    StorageError,
    NotSupported,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::AlreadyExists: return "Already exists";
        case ErrorCode::TransientNetworkError: return "Transient network error";
        case ErrorCode::AuthorizationError: return "Authorization error";
        case ErrorCode::ResourceLimitExceeded: return "Resource limit exceeded";
        case ErrorCode::RegistrationTimeout: return "Registration timeout";
        case ErrorCode::InvariantViolation: return "Invariant violation";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::PreconditionFailed: return "Precondition failed";
        case ErrorCode::StorageError: return "Storage error";
        case ErrorCode::NotSupported: return "Not supported";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Only transient network failures are eligible for automatic retry.
constexpr bool isRetryable(ErrorCode error) noexcept {
    return error == ErrorCode::TransientNetworkError || error == ErrorCode::Timeout;
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;
    std::vector<std::string> recommendations;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::vector<std::string> recs)
        : code(c), message(std::move(msg)), recommendations(std::move(recs)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

} // namespace nimbus

// fmt library support for ErrorCode (for spdlog)
#include <fmt/format.h>
template <> struct fmt::formatter<nimbus::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(nimbus::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", nimbus::errorToString(error));
    }
};
