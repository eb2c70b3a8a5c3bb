#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "PathGuard.hpp"

struct DirectoryEntry {
    std::string name;
    bool isDirectory = false;
};

struct TreeNode {
    std::string name;
    bool isDirectory = false;
    std::vector<TreeNode> children; // only meaningful for directories
};

// Search outcome that keeps "nothing found" distinct from a list of matches.
template <typename T>
struct SearchResult {
    std::vector<T> matches;
    bool hasMatches() const { return !matches.empty(); }
};

struct ContentMatch {
    std::string filePath;
    size_t lineNumber = 0;
    std::string lineText;
};

struct SkippedFile {
    std::string filePath;
    std::string reason;
};

struct ContentSearchReport {
    SearchResult<ContentMatch> result;
    std::vector<SkippedFile> skipped;
};

class DirectoryWalker {
public:
    explicit DirectoryWalker(const PathGuard& guard);

    // Immediate children in enumeration order.
    std::vector<DirectoryEntry> list(const std::filesystem::path& dir) const;

    // Recursive listing. A symlinked directory that leads back to one of its own
    // ancestors is reported with no children.
    std::vector<TreeNode> tree(const std::filesystem::path& dir) const;

    // Names under `base` containing `pattern` (case-insensitive). A directory matching
    // one of `excludePatterns` may itself be reported by name from its parent, but
    // nothing inside it is searched.
    SearchResult<std::string> searchFiles(const std::filesystem::path& base, const std::string& pattern,
                                          const std::vector<std::string>& excludePatterns) const;

    // Lines containing `query` (case-insensitive) in the regular files whose path
    // relative to `base` matches `filePattern`.
    ContentSearchReport searchContent(const std::filesystem::path& base, const std::string& query,
                                      bool recursive, const std::string& filePattern) const;

    // Right-anchored glob match in the manner of a shell path pattern: "*.txt" matches
    // any path whose last component matches, "/a/*" only a full two level path.
    static bool matchesGlob(const std::filesystem::path& path, const std::string& pattern);

private:
    void requireDirectory(const std::filesystem::path& dir) const;

    const PathGuard& guard_;
};
