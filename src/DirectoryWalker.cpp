#include "DirectoryWalker.hpp"
#include "CaseFold.hpp"
#include "FsError.hpp"
#include "LineUtils.hpp"
#include "MappedFile.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <trantor/utils/Logger.h>
#include <fnmatch.h>
#include <set>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_components(const std::string& text, bool& absolute) {
    absolute = !text.empty() && text.front() == '/';
    std::vector<std::string> parts;
    std::string current;
    for (char c : text) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

bool is_directory_noexcept(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_directory(ec);
}

bool is_symlink_noexcept(const fs::directory_entry& entry) {
    std::error_code ec;
    return entry.is_symlink(ec);
}

struct TreeBuilder {
    std::set<fs::path> ancestors;

    std::vector<TreeNode> build(const fs::path& dir) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            throw FsError::fromErrorCode(ec, "list directory", dir.string());
        }
        std::vector<TreeNode> nodes;
        for (const auto& entry : it) {
            TreeNode node;
            node.name = entry.path().filename().string();
            node.isDirectory = is_directory_noexcept(entry);
            if (node.isDirectory) {
                fs::path real = fs::canonical(entry.path(), ec);
                if (ec) {
                    throw FsError::fromErrorCode(ec, "resolve", entry.path().string());
                }
                if (ancestors.insert(real).second) {
                    node.children = build(entry.path());
                    ancestors.erase(real);
                } else {
                    LOG_WARN << "Not descending into " << entry.path().string() << ": symlink cycle";
                }
            }
            nodes.push_back(std::move(node));
        }
        return nodes;
    }
};

} // namespace

DirectoryWalker::DirectoryWalker(const PathGuard& guard) : guard_(guard) {}

void DirectoryWalker::requireDirectory(const fs::path& dir) const {
    std::error_code ec;
    auto st = fs::status(dir, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw FsError::fromErrorCode(ec, "access", dir.string());
    }
    if (!fs::exists(st)) {
        throw FsError(FsErrorKind::NotFound, "Path not found: " + dir.string());
    }
    if (!fs::is_directory(st)) {
        throw FsError(FsErrorKind::InvalidArgument, "Provided path is not a directory");
    }
}

bool DirectoryWalker::matchesGlob(const fs::path& path, const std::string& pattern) {
    bool patternAbsolute = false;
    bool pathAbsolute = false;
    auto patternParts = split_components(pattern, patternAbsolute);
    auto pathParts = split_components(path.string(), pathAbsolute);
    if (patternParts.empty()) {
        return false;
    }
    if (patternAbsolute) {
        if (!pathAbsolute || patternParts.size() != pathParts.size()) return false;
    } else if (patternParts.size() > pathParts.size()) {
        return false;
    }
    auto pathIt = pathParts.rbegin();
    for (auto patIt = patternParts.rbegin(); patIt != patternParts.rend(); ++patIt, ++pathIt) {
        if (::fnmatch(patIt->c_str(), pathIt->c_str(), 0) != 0) {
            return false;
        }
    }
    return true;
}

std::vector<DirectoryEntry> DirectoryWalker::list(const fs::path& dir) const {
    requireDirectory(dir);
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, "list directory", dir.string());
    }
    std::vector<DirectoryEntry> entries;
    for (const auto& entry : it) {
        entries.push_back({entry.path().filename().string(), is_directory_noexcept(entry)});
    }
    return entries;
}

std::vector<TreeNode> DirectoryWalker::tree(const fs::path& dir) const {
    requireDirectory(dir);
    TreeBuilder builder;
    std::error_code ec;
    builder.ancestors.insert(fs::canonical(dir, ec));
    return builder.build(dir);
}

SearchResult<std::string> DirectoryWalker::searchFiles(const fs::path& base, const std::string& pattern,
                                                       const std::vector<std::string>& excludePatterns) const {
    SearchResult<std::string> result;
    const std::string foldedPattern = fold_case(pattern);
    std::vector<fs::path> pending{base};
    while (!pending.empty()) {
        fs::path root = std::move(pending.back());
        pending.pop_back();

        bool excluded = false;
        for (const auto& exclude : excludePatterns) {
            if (matchesGlob(root, exclude)) {
                excluded = true;
                break;
            }
        }
        if (excluded) {
            continue;
        }

        std::error_code ec;
        fs::directory_iterator it(root, ec);
        if (ec) {
            if (root == base && ec == std::errc::not_a_directory) {
                break;
            }
            LOG_WARN << "Skipping unreadable directory " << root.string() << ": " << ec.message();
            continue;
        }
        std::vector<fs::path> files;
        std::vector<fs::path> dirs;
        std::vector<fs::path> descend;
        for (const auto& entry : it) {
            if (is_directory_noexcept(entry)) {
                dirs.push_back(entry.path());
                if (!is_symlink_noexcept(entry)) descend.push_back(entry.path());
            } else {
                files.push_back(entry.path());
            }
        }
        for (const auto* group : {&files, &dirs}) {
            for (const auto& candidate : *group) {
                if (contains_folded(candidate.filename().string(), foldedPattern) && guard_.isContained(candidate)) {
                    result.matches.push_back(candidate.string());
                }
            }
        }
        // Reverse so the stack visits subdirectories in enumeration order.
        pending.insert(pending.end(), descend.rbegin(), descend.rend());
    }
    return result;
}

ContentSearchReport DirectoryWalker::searchContent(const fs::path& base, const std::string& query,
                                                   bool recursive, const std::string& filePattern) const {
    requireDirectory(base);
    ContentSearchReport report;

    bool patternAbsolute = false;
    const size_t patternDepth = split_components(filePattern, patternAbsolute).size();
    if (patternDepth == 0 || patternAbsolute) {
        throw FsError(FsErrorKind::InvalidArgument, "Unacceptable file pattern: '" + filePattern + "'");
    }

    const std::string foldedQuery = fold_case(query);
    auto scanFile = [&](const fs::path& file) {
        try {
            MappedFile mapped(file.string());
            const std::string filePath = file.string();
            for_each_line(mapped.data(), mapped.size(), [&](size_t lineNumber, std::string_view raw) {
                std::string line = drop_invalid_utf8(raw);
                if (contains_folded(line, foldedQuery)) {
                    report.result.matches.push_back({filePath, lineNumber, boost::algorithm::trim_copy(line)});
                }
                return true;
            });
        } catch (const boost::interprocess::interprocess_exception& e) {
            LOG_WARN << "Could not read or search file " << file.string() << ": " << e.what();
            report.skipped.push_back({file.string(), e.what()});
        }
    };

    // Depth-first walk; directory symlinks are reported but not followed.
    std::vector<std::pair<fs::path, size_t>> pending{{base, 0}};
    while (!pending.empty()) {
        auto [dir, depth] = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            LOG_WARN << "Could not list directory " << dir.string() << ": " << ec.message();
            report.skipped.push_back({dir.string(), ec.message()});
            continue;
        }
        std::vector<std::pair<fs::path, size_t>> subdirs;
        for (const auto& entry : it) {
            const fs::path relative = entry.path().lexically_relative(base);
            const bool isDir = is_directory_noexcept(entry);
            const bool matched = recursive
                ? matchesGlob(relative, filePattern)
                : (depth + 1 == patternDepth && matchesGlob(relative, filePattern));
            if (matched && !isDir) {
                std::error_code fileEc;
                if (entry.is_regular_file(fileEc)) {
                    scanFile(entry.path());
                }
            }
            const bool descend = recursive || depth + 1 < patternDepth;
            if (isDir && descend && !is_symlink_noexcept(entry)) {
                subdirs.emplace_back(entry.path(), depth + 1);
            }
        }
        pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
    }
    return report;
}
