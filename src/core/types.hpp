#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <chrono>
#include <functional>
#include <cstdint>

// Failure categories surfaced to callers as `error_kind`
enum class ErrorKind {
    None,
    Configuration,
    Authentication,
    Connection,
    HostKey,
    PathValidation,
    PermissionDenied,
    RemoteFileExists,
    SizeLimitExceeded,
    TransferNotFound,
    Intermediary,
    InvalidArgument,
    RemoteIo,
    LocalIo,
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:              return "None";
        case ErrorKind::Configuration:     return "ConfigurationError";
        case ErrorKind::Authentication:    return "AuthenticationError";
        case ErrorKind::Connection:        return "ConnectionError";
        case ErrorKind::HostKey:           return "HostKeyError";
        case ErrorKind::PathValidation:    return "PathValidationError";
        case ErrorKind::PermissionDenied:  return "PermissionDenied";
        case ErrorKind::RemoteFileExists:  return "RemoteFileExists";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::TransferNotFound:  return "TransferNotFound";
        case ErrorKind::Intermediary:      return "IntermediaryError";
        case ErrorKind::InvalidArgument:   return "InvalidArgument";
        case ErrorKind::RemoteIo:          return "RemoteIoError";
        case ErrorKind::LocalIo:           return "LocalIoError";
    }
    return "Unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Forward the failure of another result
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of one remote command. A timeout is a flag, not a failure.
struct CommandResult {
    std::string stdout_data;
    std::string stderr_data;
    std::optional<int> exit_code;             // unset when timed out
    std::chrono::milliseconds duration{0};
    bool timed_out = false;

    bool succeeded() const { return !timed_out && exit_code && *exit_code == 0; }
};

// Remote file metadata (SFTP stat)
struct RemoteStat {
    bool exists = false;
    bool is_regular = false;
    bool is_directory = false;
    uint64_t size = 0;
    unsigned mode = 0;
};

using Clock = std::chrono::system_clock;
using ClockFn = std::function<Clock::time_point()>;

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
