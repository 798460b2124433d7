#pragma once

#include <optional>
#include <string>
#include <variant>

namespace bpfs {

/// Failure categories every filesystem operation reports.
enum class ErrorKind {
    InvalidPath,      ///< Traversal, absolute-looking or disallowed hidden segment
    NotFound,         ///< Neither physical nor virtual
    AlreadyExists,    ///< Non-racing duplicate create of a materialized target
    PermissionDenied, ///< Veto by the permission oracle or a read-only zone
    IOFailure,        ///< Underlying physical operation failed
};

const char* error_kind_name(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::IOFailure;
    std::string message;
    int sys_errno = 0; ///< Originating errno, 0 when not from a system call

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg, int err = 0)
        : kind(k), message(std::move(msg)), sys_errno(err) {}

    /// Classify a system errno: ENOENT and EEXIST keep their meaning,
    /// everything else is an IOFailure carrying the errno.
    static Error from_errno(int err, std::string msg);

    /// Positive errno value the kernel bridge reports for this error.
    int to_errno() const;
};

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace bpfs
