// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace netward {

enum class ErrorCode {
    Success = 0,
    Unknown,
    InvalidArgument,
    IoError,
    PermissionDenied,
    ResourceNotFound,
    ResourceBusy,
    ResourceExists,
    PolicyParseFailed,
    PolicyValidationFailed,
    PolicyCompileFailed,
    PolicyHashMismatch,
    NativeRejected,
    TransactionUnavailable,
    PersistenceFailed,
    BpfMapOperationFailed,
    BpfLayoutMismatch,
};

inline const char* error_code_name(ErrorCode code);

class Error {
  public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}
    Error(ErrorCode code, std::string message, std::string context)
        : code_(code), message_(std::move(message)), context_(std::move(context))
    {
    }

    static Error system(int errnum, const std::string& message)
    {
        ErrorCode code = ErrorCode::IoError;
        if (errnum == EACCES || errnum == EPERM) {
            code = ErrorCode::PermissionDenied;
        } else if (errnum == ENOENT) {
            code = ErrorCode::ResourceNotFound;
        } else if (errnum == EBUSY || errnum == EAGAIN) {
            code = ErrorCode::ResourceBusy;
        } else if (errnum == EEXIST) {
            code = ErrorCode::ResourceExists;
        }
        return Error(code, message, std::strerror(errnum));
    }

    static Error not_found(const std::string& what) { return Error(ErrorCode::ResourceNotFound, "Not found", what); }

    static Error invalid_argument(const std::string& message) { return Error(ErrorCode::InvalidArgument, message); }

    [[nodiscard]] ErrorCode code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }
    [[nodiscard]] const std::string& context() const { return context_; }

    [[nodiscard]] std::string to_string() const
    {
        std::string out = "[";
        out += error_code_name(code_);
        out += "] ";
        out += message_;
        if (!context_.empty()) {
            out += ": ";
            out += context_;
        }
        return out;
    }

  private:
    ErrorCode code_;
    std::string message_;
    std::string context_;
};

inline const char* error_code_name(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::Unknown:
            return "Unknown";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
        case ErrorCode::IoError:
            return "IoError";
        case ErrorCode::PermissionDenied:
            return "PermissionDenied";
        case ErrorCode::ResourceNotFound:
            return "ResourceNotFound";
        case ErrorCode::ResourceBusy:
            return "ResourceBusy";
        case ErrorCode::ResourceExists:
            return "ResourceExists";
        case ErrorCode::PolicyParseFailed:
            return "PolicyParseFailed";
        case ErrorCode::PolicyValidationFailed:
            return "PolicyValidationFailed";
        case ErrorCode::PolicyCompileFailed:
            return "PolicyCompileFailed";
        case ErrorCode::PolicyHashMismatch:
            return "PolicyHashMismatch";
        case ErrorCode::NativeRejected:
            return "NativeRejected";
        case ErrorCode::TransactionUnavailable:
            return "TransactionUnavailable";
        case ErrorCode::PersistenceFailed:
            return "PersistenceFailed";
        case ErrorCode::BpfMapOperationFailed:
            return "BpfMapOperationFailed";
        case ErrorCode::BpfLayoutMismatch:
            return "BpfLayoutMismatch";
    }
    return "Unknown";
}

/**
 * Result<T> holds either a value or an Error.
 *
 * Move-only value types are supported. Accessing the value of a failed
 * result (or the error of a successful one) is a programming error.
 */
template <typename T> class Result {
  public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(*this).value(); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

  private:
    std::variant<T, Error> data_;
};

template <> class Result<void> {
  public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    [[nodiscard]] bool ok() const { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const { return ok(); }

    [[nodiscard]] const Error& error() const { return *error_; }

  private:
    std::optional<Error> error_;
};

} // namespace netward

// Propagate the error of a Result-returning expression.
#define TRY(expr)                                                                                                      \
    do {                                                                                                               \
        auto _netward_try_result = (expr);                                                                             \
        if (!_netward_try_result) {                                                                                    \
            return _netward_try_result.error();                                                                        \
        }                                                                                                              \
    } while (0)
