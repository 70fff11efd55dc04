#ifndef KVMPP_AUTH_TOTP_CACHE_HPP
#define KVMPP_AUTH_TOTP_CACHE_HPP

#include "kvmpp/auth/totp.hpp"
#include "kvmpp/device/device_error.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// TotpCacheConfig
// ─────────────────────────────────────────────────────────────────────────────

struct TotpCacheConfig {
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    /// A cached code is only handed out while at least this much of its
    /// window remains.
    std::chrono::seconds safety_buffer{5};

    /// Wall clock; replaced in tests.
    Clock clock = [] { return std::chrono::system_clock::now(); };

    TotpCacheConfig& with_safety_buffer(std::chrono::seconds buffer) {
        safety_buffer = buffer;
        return *this;
    }

    TotpCacheConfig& with_clock(Clock fn) {
        clock = std::move(fn);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// TotpCache
// ─────────────────────────────────────────────────────────────────────────────
// Per-secret memo of the current TOTP code and the end of its time step.
//
// get_code() returns the cached code while `now < expiry - safety_buffer`,
// and otherwise generates (and stores) the code for the current step. A
// forced refresh always regenerates. Entries are overwritten, never evicted;
// the map grows with the number of distinct secrets.
//
// Thread-safe: one mutex guards the map. Generation runs under the lock
// (it is a local HMAC, no I/O).

class TotpCache {
public:
    explicit TotpCache(
        std::shared_ptr<ITotpGenerator> generator,
        TotpCacheConfig config = {}
    );

    TotpCache(const TotpCache&) = delete;
    TotpCache& operator=(const TotpCache&) = delete;

    /// Current code for `secret`. Fails with SecondFactorUnavailable if no
    /// generator was supplied and InvalidSecret for a malformed secret.
    [[nodiscard]] DeviceResult<std::string> get_code(const std::string& secret, bool refresh = false);

    /// Seconds until the cached code's step ends; zero when nothing is
    /// cached for `secret` or the step is over.
    [[nodiscard]] std::chrono::seconds time_remaining(const std::string& secret) const;

    [[nodiscard]] bool has_generator() const noexcept {
        return generator_ != nullptr;
    }

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::chrono::seconds safety_buffer() const noexcept {
        return config_.safety_buffer;
    }

private:
    struct Entry {
        std::string code;
        std::chrono::sys_seconds expiry;
    };

    [[nodiscard]] std::chrono::sys_seconds now_seconds() const;

    std::shared_ptr<ITotpGenerator> generator_;
    TotpCacheConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace kvmpp

#endif  // KVMPP_AUTH_TOTP_CACHE_HPP
