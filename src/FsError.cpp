#include "FsError.hpp"
#include <cerrno>

const char* toString(FsErrorKind kind) {
    switch (kind) {
        case FsErrorKind::AccessDenied: return "access_denied";
        case FsErrorKind::NotFound: return "not_found";
        case FsErrorKind::PermissionDenied: return "permission_denied";
        case FsErrorKind::EditNotFound: return "edit_not_found";
        case FsErrorKind::InvalidToken: return "invalid_token";
        case FsErrorKind::TokenExpired: return "token_expired";
        case FsErrorKind::ParameterMismatch: return "parameter_mismatch";
        case FsErrorKind::DirectoryNotEmpty: return "directory_not_empty";
        case FsErrorKind::InvalidArgument: return "invalid_argument";
        case FsErrorKind::IOFailure: return "io_failure";
    }
    return "io_failure";
}

FsError::FsError(FsErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

FsError FsError::accessDenied(const std::string& requestedPath, const std::vector<std::string>& allowedRoots) {
    FsError err(FsErrorKind::AccessDenied,
                "Access denied: " + requestedPath + " is outside allowed directories");
    err.requestedPath_ = requestedPath;
    err.allowedRoots_ = allowedRoots;
    return err;
}

FsError FsError::fromErrorCode(const std::error_code& ec, const std::string& action, const std::string& path) {
    const int code = ec.value();
    if (code == ENOENT) {
        return FsError(FsErrorKind::NotFound, "Path not found: " + path);
    }
    if (code == EACCES || code == EPERM) {
        return FsError(FsErrorKind::PermissionDenied, "Permission denied to " + action + ": " + path);
    }
    return FsError(FsErrorKind::IOFailure, "Failed to " + action + " " + path + ": " + ec.message());
}
