#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "ConfirmationStore.hpp"

// Two-phase confirmation of destructive requests. issue() hands out a short single-use
// token bound to {path, recursive}; redeem() checks and consumes it. Every call is one
// critical section over the underlying store.
class ConfirmationRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    using TokenSource = std::function<std::string()>;

    static constexpr std::chrono::seconds kDefaultTtl{60};
    static constexpr size_t kTokenLength = 5;

    explicit ConfirmationRegistry(std::unique_ptr<ConfirmationStore> store,
                                  std::chrono::seconds ttl = kDefaultTtl,
                                  Clock clock = nullptr,
                                  TokenSource tokenSource = nullptr);

    PendingConfirmation issue(const std::string& path, bool recursive);

    // Throws FsError InvalidToken, TokenExpired or ParameterMismatch. On success the
    // token is gone before this returns.
    void redeem(const std::string& token, const std::string& path, bool recursive);

    std::vector<PendingConfirmation> pending();

    std::chrono::seconds ttl() const { return ttl_; }

    // Hex token from the system's secure random source.
    static std::string randomToken();

private:
    std::unique_ptr<ConfirmationStore> store_;
    std::chrono::seconds ttl_;
    Clock clock_;
    TokenSource tokenSource_;
    std::mutex mutex_;
};
