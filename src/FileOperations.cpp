#include "FileOperations.hpp"
#include "FsError.hpp"
#include "LineUtils.hpp"
#include "TimeFormat.hpp"
#include <trantor/utils/Logger.h>
#include <cerrno>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace {

std::error_code last_os_error() {
    return std::error_code(errno, std::generic_category());
}

bool exists_no_follow(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

} // namespace

FileOperations::FileOperations(const PathGuard& guard, ConfirmationRegistry& confirmations)
    : guard_(guard), confirmations_(confirmations), walker_(guard) {}

std::string FileOperations::readText(const fs::path& file, const std::string& requested) const {
    std::error_code ec;
    auto st = fs::status(file, ec);
    if (!fs::exists(st)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw FsError::fromErrorCode(ec, "read file", requested);
        }
        throw FsError(FsErrorKind::NotFound, "File not found: " + requested);
    }
    if (fs::is_directory(st)) {
        throw FsError(FsErrorKind::IOFailure, "Failed to read file " + requested + ": Is a directory");
    }
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw FsError::fromErrorCode(last_os_error(), "read file", requested);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw FsError(FsErrorKind::IOFailure, "Failed to read file " + requested);
    }
    std::string content = ss.str();
    if (!is_valid_utf8(content)) {
        throw FsError(FsErrorKind::IOFailure, "Failed to read file " + requested + ": content is not valid UTF-8");
    }
    return content;
}

void FileOperations::writeText(const fs::path& file, const std::string& requested, const std::string& content) const {
    if (!is_valid_utf8(content)) {
        throw FsError(FsErrorKind::InvalidArgument, "Content for " + requested + " is not valid UTF-8");
    }
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FsError::fromErrorCode(last_os_error(), "write to", requested);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw FsError(FsErrorKind::IOFailure, "Failed to write to " + requested);
    }
}

std::string FileOperations::read(const std::string& path) const {
    return readText(guard_.normalize(path), path);
}

std::string FileOperations::write(const std::string& path, const std::string& content) const {
    writeText(guard_.normalize(path), path, content);
    return "Successfully wrote to " + path;
}

EditOutcome FileOperations::edit(const std::string& path, const std::vector<EditOperation>& edits, bool dryRun) const {
    fs::path file = guard_.normalize(path);
    const std::string original = readText(file, path);
    const std::string modified = TextEditor::applyEdits(original, edits);

    EditOutcome outcome;
    outcome.dryRun = dryRun;
    if (dryRun) {
        outcome.diff = TextEditor::diff(original, modified, path);
        return outcome;
    }
    writeText(file, path, modified);
    outcome.message = "Successfully edited file " + path;
    return outcome;
}

std::string FileOperations::createDirectory(const std::string& path) const {
    fs::path dir = guard_.normalize(path);
    std::error_code ec;
    auto st = fs::status(dir, ec);
    if (fs::exists(st) && !fs::is_directory(st)) {
        throw FsError(FsErrorKind::InvalidArgument, "Path exists and is not a directory: " + path);
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw FsError::fromErrorCode(ec, "create directory", path);
    }
    return "Successfully created directory " + path;
}

std::vector<DirectoryEntry> FileOperations::list(const std::string& path) const {
    return walker_.list(guard_.normalize(path));
}

std::vector<TreeNode> FileOperations::tree(const std::string& path) const {
    return walker_.tree(guard_.normalize(path));
}

SearchResult<std::string> FileOperations::searchFiles(const std::string& path, const std::string& pattern,
                                                      const std::vector<std::string>& excludePatterns) const {
    return walker_.searchFiles(guard_.normalize(path), pattern, excludePatterns);
}

ContentSearchReport FileOperations::searchContent(const std::string& path, const std::string& query,
                                                  bool recursive, const std::string& filePattern) const {
    return walker_.searchContent(guard_.normalize(path), query, recursive, filePattern);
}

DeleteOutcome FileOperations::deletePath(const std::string& path, bool recursive, const std::optional<std::string>& token) {
    fs::path target = guard_.normalize(path);
    DeleteOutcome outcome;

    if (!token || token->empty()) {
        std::error_code ec;
        auto st = fs::symlink_status(target, ec);
        if (!fs::exists(st)) {
            throw FsError(FsErrorKind::NotFound, "Path not found: " + path);
        }
        outcome.confirmationRequired = true;
        outcome.confirmation = confirmations_.issue(target.string(), recursive);
        const char* kind = fs::is_directory(st) ? "directory" : "file";
        outcome.message = std::string("`Confirm deletion of ") + kind + ": " + path + " with token " +
                          outcome.confirmation.token + "`";
        return outcome;
    }

    confirmations_.redeem(*token, target.string(), recursive);
    outcome.message = removeTarget(target, path, recursive);
    LOG_INFO << outcome.message;
    return outcome;
}

std::string FileOperations::removeTarget(const fs::path& target, const std::string& requested, bool recursive) const {
    std::error_code ec;
    auto st = fs::symlink_status(target, ec);
    if (!fs::exists(st)) {
        throw FsError(FsErrorKind::NotFound, "Path not found: " + requested);
    }
    if (fs::is_regular_file(st) || fs::is_symlink(st)) {
        fs::remove(target, ec);
        if (ec) {
            throw FsError::fromErrorCode(ec, "delete", requested);
        }
        return "Successfully deleted file: " + requested;
    }
    if (!fs::is_directory(st)) {
        throw FsError(FsErrorKind::InvalidArgument, "Path is not a file or directory: " + requested);
    }
    if (recursive) {
        fs::remove_all(target, ec);
        if (ec) {
            throw FsError::fromErrorCode(ec, "delete", requested);
        }
        return "Successfully deleted directory recursively: " + requested;
    }
    fs::remove(target, ec);
    if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
        throw FsError(FsErrorKind::DirectoryNotEmpty,
                      "Directory not empty. Use 'recursive=true' to delete non-empty directories. Original error: " +
                          ec.message());
    }
    if (ec) {
        throw FsError::fromErrorCode(ec, "delete", requested);
    }
    return "Successfully deleted empty directory: " + requested;
}

std::string FileOperations::move(const std::string& sourcePath, const std::string& destinationPath) const {
    fs::path source = guard_.normalize(sourcePath);
    fs::path destination = guard_.normalize(destinationPath);

    if (!exists_no_follow(source)) {
        throw FsError(FsErrorKind::NotFound, "Source path not found: " + sourcePath);
    }

    std::error_code ec;
    fs::path target = destination;
    if (fs::is_directory(destination, ec) && source != destination) {
        target = destination / source.filename();
        if (exists_no_follow(target)) {
            throw FsError(FsErrorKind::InvalidArgument, "Destination path '" + target.string() + "' already exists");
        }
    }
    if (fs::is_directory(source, ec)) {
        const std::string prefix = source.string() + "/";
        if (target.string().compare(0, prefix.size(), prefix) == 0) {
            throw FsError(FsErrorKind::InvalidArgument,
                          "Cannot move a directory '" + sourcePath + "' into itself '" + destinationPath + "'");
        }
    }

    fs::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        LOG_INFO << "Moving " << source.string() << " across devices by copy";
        ec.clear();
        fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
        if (!ec) {
            fs::remove_all(source, ec);
        }
    }
    if (ec) {
        throw FsError::fromErrorCode(ec, "move", "'" + sourcePath + "' to '" + destinationPath + "'");
    }
    return "Successfully moved '" + sourcePath + "' to '" + destinationPath + "'";
}

FileMetadata FileOperations::getMetadata(const std::string& path) const {
    fs::path target = guard_.normalize(path);

    struct stat st {};
    if (::stat(target.c_str(), &st) != 0) {
        std::error_code ec = last_os_error();
        if (ec == std::errc::no_such_file_or_directory) {
            throw FsError(FsErrorKind::NotFound, "Path not found: " + path);
        }
        throw FsError::fromErrorCode(ec, "access metadata for", path);
    }

    FileMetadata meta;
    meta.path = target.string();
    if (S_ISREG(st.st_mode)) {
        meta.kind = "file";
    } else if (S_ISDIR(st.st_mode)) {
        meta.kind = "directory";
    } else {
        meta.kind = "other";
    }
    meta.sizeBytes = static_cast<uintmax_t>(st.st_size);
    meta.modifiedUtc = format_utc(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    meta.metadataChangedUtc = format_utc(st.st_ctim.tv_sec, st.st_ctim.tv_nsec);
    meta.createdUtc = meta.metadataChangedUtc;
#ifdef STATX_BTIME
    struct statx stx {};
    if (::statx(AT_FDCWD, target.c_str(), 0, STATX_BTIME, &stx) == 0 && (stx.stx_mask & STATX_BTIME)) {
        meta.createdUtc = format_utc(stx.stx_btime.tv_sec, stx.stx_btime.tv_nsec);
    }
#endif
    return meta;
}
