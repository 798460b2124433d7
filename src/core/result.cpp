#include "core/result.hpp"

#include <cerrno>

namespace bpfs {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidPath: return "InvalidPath";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::AlreadyExists: return "AlreadyExists";
    case ErrorKind::PermissionDenied: return "PermissionDenied";
    case ErrorKind::IOFailure: return "IOFailure";
    }
    return "Unknown";
}

Error Error::from_errno(int err, std::string msg) {
    switch (err) {
    case ENOENT:
        return Error(ErrorKind::NotFound, std::move(msg), err);
    case EEXIST:
        return Error(ErrorKind::AlreadyExists, std::move(msg), err);
    default:
        return Error(ErrorKind::IOFailure, std::move(msg), err);
    }
}

int Error::to_errno() const {
    switch (kind) {
    case ErrorKind::InvalidPath: return EINVAL;
    case ErrorKind::NotFound: return ENOENT;
    case ErrorKind::AlreadyExists: return EEXIST;
    case ErrorKind::PermissionDenied: return EACCES;
    case ErrorKind::IOFailure: return sys_errno != 0 ? sys_errno : EIO;
    }
    return EIO;
}

} // namespace bpfs
