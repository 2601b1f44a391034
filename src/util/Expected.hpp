#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace batchfs {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotFound,
    PermissionDenied,
    IoError,
    UnsupportedMode,
    NameExhausted,
    InternalError
};

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

/// Short stable name of an error code, used in log lines
inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::PermissionDenied: return "permission-denied";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::UnsupportedMode: return "unsupported-mode";
        case ErrorCode::NameExhausted: return "name-exhausted";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

/**
 * @brief Translate a filesystem error_code into an Error
 *
 * ENOENT maps to NotFound, EACCES/EPERM to PermissionDenied, everything
 * else to IoError. The context is prepended to the system message.
 */
inline Error errorFromCode(const std::error_code& ec, const std::string& context) {
    ErrorCode code = ErrorCode::IoError;
    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::NotFound;
    } else if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        code = ErrorCode::PermissionDenied;
    }
    return Error{code, context + ": " + ec.message()};
}

}
