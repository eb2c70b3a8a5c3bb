#include "PathGuard.hpp"
#include "CaseFold.hpp"
#include "FsError.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <trantor/utils/Logger.h>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {

fs::path resolve(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    fs::path resolved = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return absolute.lexically_normal();
    }
    return resolved;
}

std::string stripTrailingSeparator(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

} // namespace

PathGuard::PathGuard(const std::vector<std::string>& roots) {
    for (const auto& root : roots) {
        fs::path expanded = expandUser(root);
        if (!expanded.is_absolute()) {
            throw FsError(FsErrorKind::InvalidArgument, "Allowed directory must be an absolute path: " + root);
        }
        std::error_code ec;
        if (!fs::is_directory(expanded, ec)) {
            LOG_WARN << "Allowed directory does not exist (yet): " << root;
        }
        allowedRoots_.push_back(stripTrailingSeparator(resolve(expanded).string()));
        foldedRoots_.push_back(fold_case(allowedRoots_.back()));
    }
    if (allowedRoots_.empty()) {
        throw FsError(FsErrorKind::InvalidArgument, "At least one allowed directory must be configured");
    }
}

fs::path PathGuard::expandUser(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return fs::path(path);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return fs::path(path);
    }
    return fs::path(home) / path.substr(path.size() > 1 ? 2 : 1);
}

bool PathGuard::isContained(const fs::path& resolved) const {
    const std::string candidate = fold_case(resolved.string());
    for (const auto& root : foldedRoots_) {
        if (!boost::algorithm::starts_with(candidate, root)) {
            continue;
        }
        // Whole path segments only: /data/foo must not admit /data/foobar.
        if (candidate.size() == root.size() || root.back() == '/' || candidate[root.size()] == '/') {
            return true;
        }
    }
    return false;
}

fs::path PathGuard::normalize(const std::string& requested) const {
    fs::path resolved = resolve(expandUser(requested));
    if (!isContained(resolved)) {
        throw FsError::accessDenied(resolved.string(), allowedRoots_);
    }
    return resolved;
}
