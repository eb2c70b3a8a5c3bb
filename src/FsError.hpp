#pragma once
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

enum class FsErrorKind {
    AccessDenied,
    NotFound,
    PermissionDenied,
    EditNotFound,
    InvalidToken,
    TokenExpired,
    ParameterMismatch,
    DirectoryNotEmpty,
    InvalidArgument,
    IOFailure
};

// Stable identifier sent to clients, e.g. "access_denied".
const char* toString(FsErrorKind kind);

class FsError : public std::runtime_error {
public:
    FsError(FsErrorKind kind, const std::string& message);

    static FsError accessDenied(const std::string& requestedPath, const std::vector<std::string>& allowedRoots);

    // Translate an OS error raised while working on `path`. `action` reads like "read file".
    static FsError fromErrorCode(const std::error_code& ec, const std::string& action, const std::string& path);

    FsErrorKind kind() const { return kind_; }
    const std::string& requestedPath() const { return requestedPath_; }
    const std::vector<std::string>& allowedRoots() const { return allowedRoots_; }

private:
    FsErrorKind kind_;
    std::string requestedPath_;
    std::vector<std::string> allowedRoots_;
};
