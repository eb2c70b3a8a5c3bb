#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

struct PendingConfirmation {
    std::string token;
    std::string path;
    bool recursive = false;
    std::chrono::system_clock::time_point expiry;
};

// Keyed storage for pending confirmations.
class ConfirmationStore {
public:
    using Entries = std::map<std::string, PendingConfirmation>;
    // Mutates the entries in place; returns true when they must be written back.
    using Mutation = std::function<bool(Entries&)>;

    virtual ~ConfirmationStore() = default;

    virtual Entries load() = 0;
    // Read, mutate and write back as one step that no other user of the store can
    // interleave with. Exceptions from `mutate` leave the stored entries untouched.
    virtual void update(const Mutation& mutate) = 0;
    virtual void clear() = 0;
};

class MemoryConfirmationStore : public ConfirmationStore {
public:
    Entries load() override;
    void update(const Mutation& mutate) override;
    void clear() override;

private:
    Entries entries_;
};

// JSON file backed store. The file is removed on construction so nothing from a
// previous run is honored. Every call holds an advisory lock on "<file>.lock" for its
// whole duration, which serializes processes sharing the file. The lock is per process:
// threads of one process are serialized by the ConfirmationRegistry instead.
class FileConfirmationStore : public ConfirmationStore {
public:
    explicit FileConfirmationStore(std::string filePath);

    Entries load() override;
    void update(const Mutation& mutate) override;
    void clear() override;

    const std::string& filePath() const { return filePath_; }

private:
    Entries readUnlocked();
    void writeUnlocked(const Entries& entries);

    std::string filePath_;
    std::string lockPath_;
};

// Builds the store named by the configuration: ":memory:" or a file path.
std::unique_ptr<ConfirmationStore> makeConfirmationStore(const std::string& location);
