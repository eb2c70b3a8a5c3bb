#pragma once
#include <filesystem>
#include <string>
#include <vector>

// Resolves client supplied paths and confines them to the configured roots.
// The root set is fixed at construction and never changes afterwards.
class PathGuard {
public:
    // Throws FsError(InvalidArgument) if `roots` is empty or holds a relative path.
    explicit PathGuard(const std::vector<std::string>& roots);

    // Expand `~`, make absolute and resolve symlinks of the existing prefix, then
    // require the result to lie inside one of the roots. Throws FsError(AccessDenied).
    std::filesystem::path normalize(const std::string& requested) const;

    // Containment test for an already resolved absolute path. Comparison ignores
    // case, including non-ASCII letters.
    bool isContained(const std::filesystem::path& resolved) const;

    const std::vector<std::string>& allowedRoots() const { return allowedRoots_; }

    static std::filesystem::path expandUser(const std::string& path);

private:
    std::vector<std::string> allowedRoots_;
    std::vector<std::string> foldedRoots_;
};
