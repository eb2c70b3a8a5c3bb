#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ConfirmationRegistry.hpp"
#include "DirectoryWalker.hpp"
#include "PathGuard.hpp"
#include "TextEditor.hpp"

struct EditOutcome {
    bool dryRun = false;
    std::string diff;    // set for dry runs
    std::string message; // set when the file was written
};

struct DeleteOutcome {
    bool confirmationRequired = false;
    PendingConfirmation confirmation; // set when confirmationRequired
    std::string message;
};

struct FileMetadata {
    std::string path;
    std::string kind; // "file", "directory" or "other"
    uintmax_t sizeBytes = 0;
    std::string modifiedUtc;
    std::string createdUtc; // birth time where the filesystem records it, else ctime
    std::string metadataChangedUtc;
};

// The operations offered to clients. Every path argument goes through the PathGuard
// before the filesystem is touched; failures are thrown as FsError.
class FileOperations {
public:
    FileOperations(const PathGuard& guard, ConfirmationRegistry& confirmations);

    std::string read(const std::string& path) const;
    std::string write(const std::string& path, const std::string& content) const;
    EditOutcome edit(const std::string& path, const std::vector<EditOperation>& edits, bool dryRun) const;
    std::string createDirectory(const std::string& path) const;
    std::vector<DirectoryEntry> list(const std::string& path) const;
    std::vector<TreeNode> tree(const std::string& path) const;
    SearchResult<std::string> searchFiles(const std::string& path, const std::string& pattern,
                                          const std::vector<std::string>& excludePatterns) const;
    ContentSearchReport searchContent(const std::string& path, const std::string& query,
                                      bool recursive = true, const std::string& filePattern = "*") const;

    // Without a token: issue one and delete nothing. With a token: redeem it, then delete.
    DeleteOutcome deletePath(const std::string& path, bool recursive, const std::optional<std::string>& token);

    std::string move(const std::string& sourcePath, const std::string& destinationPath) const;
    FileMetadata getMetadata(const std::string& path) const;

    const std::vector<std::string>& allowedRoots() const { return guard_.allowedRoots(); }

private:
    std::string readText(const std::filesystem::path& file, const std::string& requested) const;
    void writeText(const std::filesystem::path& file, const std::string& requested, const std::string& content) const;
    std::string removeTarget(const std::filesystem::path& target, const std::string& requested, bool recursive) const;

    const PathGuard& guard_;
    ConfirmationRegistry& confirmations_;
    DirectoryWalker walker_;
};
