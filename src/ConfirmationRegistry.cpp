#include "ConfirmationRegistry.hpp"
#include "FsError.hpp"
#include <boost/random/random_device.hpp>
#include <trantor/utils/Logger.h>
#include <iomanip>
#include <sstream>

namespace {

constexpr int kMaxTokenAttempts = 64;

enum class RedeemOutcome { Accepted, Unknown, Expired, Mismatch };

// Drops expired entries except `keep`, which the caller wants to judge itself.
bool purgeExpired(ConfirmationStore::Entries& entries, std::chrono::system_clock::time_point now,
                  const std::string& keep = std::string()) {
    bool changed = false;
    for (auto it = entries.begin(); it != entries.end();) {
        if (it->first != keep && now > it->second.expiry) {
            it = entries.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }
    return changed;
}

} // namespace

ConfirmationRegistry::ConfirmationRegistry(std::unique_ptr<ConfirmationStore> store,
                                           std::chrono::seconds ttl,
                                           Clock clock,
                                           TokenSource tokenSource)
    : store_(std::move(store)),
      ttl_(ttl),
      clock_(clock ? std::move(clock) : Clock([] { return std::chrono::system_clock::now(); })),
      tokenSource_(tokenSource ? std::move(tokenSource) : TokenSource(&ConfirmationRegistry::randomToken)) {
    store_->clear();
}

std::string ConfirmationRegistry::randomToken() {
    boost::random::random_device rng;
    std::stringstream ss;
    // 3 random bytes give 6 hex digits; the token keeps the first kTokenLength.
    for (int i = 0; i < 3; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (rng() & 0xFFu);
    }
    return ss.str().substr(0, kTokenLength);
}

PendingConfirmation ConfirmationRegistry::issue(const std::string& path, bool recursive) {
    std::lock_guard lock(mutex_);
    const auto now = clock_();
    PendingConfirmation entry;
    entry.path = path;
    entry.recursive = recursive;
    entry.expiry = now + ttl_;

    store_->update([&](ConfirmationStore::Entries& entries) {
        purgeExpired(entries, now);
        for (int attempt = 0; attempt < kMaxTokenAttempts; ++attempt) {
            std::string candidate = tokenSource_();
            if (entries.find(candidate) == entries.end()) {
                entry.token = std::move(candidate);
                entries[entry.token] = entry;
                return true;
            }
        }
        throw FsError(FsErrorKind::IOFailure, "Could not allocate a unique confirmation token");
    });
    LOG_INFO << "Issued confirmation token " << entry.token << " for " << path << (recursive ? " (recursive)" : "");
    return entry;
}

void ConfirmationRegistry::redeem(const std::string& token, const std::string& path, bool recursive) {
    std::lock_guard lock(mutex_);
    const auto now = clock_();
    RedeemOutcome outcome = RedeemOutcome::Unknown;

    store_->update([&](ConfirmationStore::Entries& entries) {
        const bool purged = purgeExpired(entries, now, token);
        auto it = entries.find(token);
        if (it == entries.end()) {
            outcome = RedeemOutcome::Unknown;
            return purged;
        }
        if (now > it->second.expiry) {
            outcome = RedeemOutcome::Expired;
            entries.erase(it);
            return true;
        }
        if (it->second.path != path || it->second.recursive != recursive) {
            outcome = RedeemOutcome::Mismatch;
            return purged;
        }
        outcome = RedeemOutcome::Accepted;
        entries.erase(it);
        return true;
    });

    switch (outcome) {
        case RedeemOutcome::Unknown:
            throw FsError(FsErrorKind::InvalidToken, "Invalid or expired confirmation token.");
        case RedeemOutcome::Expired:
            throw FsError(FsErrorKind::TokenExpired, "Confirmation token has expired.");
        case RedeemOutcome::Mismatch:
            throw FsError(FsErrorKind::ParameterMismatch,
                          "Request parameters (path, recursive) do not match the original request for this token.");
        case RedeemOutcome::Accepted:
            break;
    }
    LOG_INFO << "Confirmation token " << token << " redeemed for " << path;
}

std::vector<PendingConfirmation> ConfirmationRegistry::pending() {
    std::lock_guard lock(mutex_);
    const auto now = clock_();
    ConfirmationStore::Entries live;
    store_->update([&](ConfirmationStore::Entries& entries) {
        const bool purged = purgeExpired(entries, now);
        live = entries;
        return purged;
    });
    std::vector<PendingConfirmation> out;
    out.reserve(live.size());
    for (auto& [token, entry] : live) {
        out.push_back(std::move(entry));
    }
    return out;
}
