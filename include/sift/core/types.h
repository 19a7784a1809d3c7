#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace sift {

using Hash = std::string; ///< Lowercase hex SHA-256
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;
using TimePoint = std::chrono::system_clock::time_point;
using Metadata = std::map<std::string, std::string>;

inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;

enum class ErrorCode {
    Success = 0,
    // Input and lookup
    InvalidArgument,
    InvalidData,
    NotFound,
    FileNotFound,
    PermissionDenied,
    NotSupported,
    // Storage and transport
    DatabaseError,
    NetworkError,
    CorruptedData,
    // Flow control
    QueueFull,
    OperationCancelled,
    SystemShutdown,
    Timeout,
    ResourceExhausted,
    // Programming and lifecycle
    InvalidState,
    NotInitialized,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::DatabaseError:
            return "Database error";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::CorruptedData:
            return "Corrupted data";
        case ErrorCode::QueueFull:
            return "Queue full";
        case ErrorCode::OperationCancelled:
            return "Operation cancelled";
        case ErrorCode::SystemShutdown:
            return "System shutdown";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::ResourceExhausted:
            return "Resource exhausted";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::NotInitialized:
            return "Not initialized";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::Unknown:
            break;
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * @brief Value or Error. value() and error() throw std::logic_error when misused.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode code) : data_(Error{code}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
        return std::get<0>(std::move(data_));
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value");
        return std::get<1>(data_);
    }

private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode code) : error_(Error{code}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return !error_.has_value(); }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (error_)
            throw std::logic_error("Result holds an error: " + error_->message);
    }

    const Error& error() const {
        if (!error_)
            throw std::logic_error("Result holds a value");
        return *error_;
    }

private:
    std::optional<Error> error_;
};

} // namespace sift

#include <spdlog/fmt/fmt.h>

// Lets spdlog and fmt print codes directly
template <> struct fmt::formatter<sift::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(sift::ErrorCode code, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", sift::errorToString(code));
    }
};
