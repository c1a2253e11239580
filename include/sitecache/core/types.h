#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace sitecache {

using Port = std::uint16_t;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    InvalidArgument,
    InvalidState,
    InvalidData,
    ValidationError,
    NotFound,
    PreconditionFailed,
    PortConflict,
    ResourceExhausted,
    OperationCancelled,
    OperationInProgress,
    WriteError,
    ExternalCommandFailed,
    ServiceStartFailed,
    ProbeFailed,
    AuthenticationFailed,
    NetworkError,
    Timeout,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::PermissionDenied: return "Permission denied";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::ValidationError: return "Validation error";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PreconditionFailed: return "Precondition failed";
        case ErrorCode::PortConflict: return "Port conflict";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::OperationInProgress: return "Operation in progress";
        case ErrorCode::WriteError: return "Write error";
        case ErrorCode::ExternalCommandFailed: return "External command failed";
        case ErrorCode::ServiceStartFailed: return "Service failed to start";
        case ErrorCode::ProbeFailed: return "Liveness probe failed";
        case ErrorCode::AuthenticationFailed: return "Authentication failed";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Result type for operations that can fail
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
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error: " + std::get<Error>(data_).message);
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
            throw std::runtime_error("Result contains error: " + error_.message);
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

} // namespace sitecache

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<sitecache::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(sitecache::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", sitecache::errorToString(error));
    }
};
