#include "ConfirmationStore.hpp"
#include "FsError.hpp"
#include "TimeFormat.hpp"
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>
#include <json/json.h>
#include <trantor/utils/Logger.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using FileLockGuard = boost::interprocess::scoped_lock<boost::interprocess::file_lock>;

ConfirmationStore::Entries MemoryConfirmationStore::load() {
    return entries_;
}

void MemoryConfirmationStore::update(const Mutation& mutate) {
    Entries working = entries_;
    if (mutate(working)) {
        entries_ = std::move(working);
    }
}

void MemoryConfirmationStore::clear() {
    entries_.clear();
}

FileConfirmationStore::FileConfirmationStore(std::string filePath)
    : filePath_(std::move(filePath)), lockPath_(filePath_ + ".lock") {
    {
        // file_lock needs an existing file to lock on.
        std::ofstream touch(lockPath_, std::ios::app);
        if (!touch) {
            throw FsError(FsErrorKind::IOFailure, "Cannot create confirmation lock file: " + lockPath_);
        }
    }
    std::error_code ec;
    if (fs::remove(filePath_, ec)) {
        LOG_INFO << "Discarded stale confirmation file " << filePath_;
    } else if (ec) {
        LOG_WARN << "Could not remove stale confirmation file " << filePath_ << ": " << ec.message();
    }
}

ConfirmationStore::Entries FileConfirmationStore::readUnlocked() {
    Entries entries;
    std::ifstream in(filePath_);
    if (!in) {
        return entries;
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs) || !root.isObject()) {
        LOG_ERROR << "Error loading confirmations file " << filePath_ << ": " << errs << ". Starting empty.";
        return entries;
    }
    for (const auto& token : root.getMemberNames()) {
        const Json::Value& item = root[token];
        if (!item.isObject() || !item["path"].isString() || !item["recursive"].isBool() || !item["expiry_ms"].isInt64()) {
            LOG_WARN << "Skipping invalid confirmation data for token " << token;
            continue;
        }
        PendingConfirmation entry;
        entry.token = token;
        entry.path = item["path"].asString();
        entry.recursive = item["recursive"].asBool();
        entry.expiry = from_epoch_millis(item["expiry_ms"].asInt64());
        entries.emplace(token, std::move(entry));
    }
    return entries;
}

void FileConfirmationStore::writeUnlocked(const Entries& entries) {
    Json::Value root(Json::objectValue);
    for (const auto& [token, entry] : entries) {
        Json::Value item;
        item["path"] = entry.path;
        item["recursive"] = entry.recursive;
        item["expiry"] = format_utc(entry.expiry);
        item["expiry_ms"] = static_cast<Json::Int64>(to_epoch_millis(entry.expiry));
        root[token] = item;
    }
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";

    const std::string tmpPath = filePath_ + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out) {
            throw FsError(FsErrorKind::IOFailure, "Error saving confirmations file: cannot open " + tmpPath);
        }
        out << Json::writeString(writer, root);
        if (!out.flush()) {
            throw FsError(FsErrorKind::IOFailure, "Error saving confirmations file: write to " + tmpPath + " failed");
        }
    }
    std::error_code ec;
    fs::rename(tmpPath, filePath_, ec);
    if (ec) {
        throw FsError(FsErrorKind::IOFailure, "Error saving confirmations file " + filePath_ + ": " + ec.message());
    }
}

ConfirmationStore::Entries FileConfirmationStore::load() {
    boost::interprocess::file_lock lock(lockPath_.c_str());
    FileLockGuard guard(lock);
    return readUnlocked();
}

void FileConfirmationStore::update(const Mutation& mutate) {
    boost::interprocess::file_lock lock(lockPath_.c_str());
    FileLockGuard guard(lock);
    Entries entries = readUnlocked();
    if (mutate(entries)) {
        writeUnlocked(entries);
    }
}

void FileConfirmationStore::clear() {
    boost::interprocess::file_lock lock(lockPath_.c_str());
    FileLockGuard guard(lock);
    std::error_code ec;
    fs::remove(filePath_, ec);
    if (ec) {
        throw FsError(FsErrorKind::IOFailure, "Cannot clear confirmations file " + filePath_ + ": " + ec.message());
    }
}

std::unique_ptr<ConfirmationStore> makeConfirmationStore(const std::string& location) {
    if (location == ":memory:") {
        return std::make_unique<MemoryConfirmationStore>();
    }
    return std::make_unique<FileConfirmationStore>(location);
}
