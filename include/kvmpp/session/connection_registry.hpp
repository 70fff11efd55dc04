#pragma once

#include "kvmpp/auth/totp_cache.hpp"
#include "kvmpp/device/device_client.hpp"
#include "kvmpp/device/device_client_config.hpp"
#include "kvmpp/device/device_error.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Identity Key
// ─────────────────────────────────────────────────────────────────────────────
// Pooling granularity: one connection per (user, host, scheme). The password
// and secret are deliberately not part of it.

struct IdentityKey {
    std::string username;
    std::string hostname;
    Scheme scheme{Scheme::Https};

    [[nodiscard]] static IdentityKey from_config(const DeviceClientConfig& config) {
        return {config.username, config.hostname, config.scheme};
    }

    /// "admin@pikvm.local:https"
    [[nodiscard]] std::string to_string() const {
        return username + "@" + hostname + ":" + std::string(kvmpp::to_string(scheme));
    }

    bool operator==(const IdentityKey&) const = default;
};

struct IdentityKeyHash {
    std::size_t operator()(const IdentityKey& key) const noexcept {
        std::size_t seed = std::hash<std::string>{}(key.username);
        const auto mix = [&seed](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        mix(std::hash<std::string>{}(key.hostname));
        mix(std::hash<int>{}(static_cast<int>(key.scheme)));
        return seed;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Registry Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ConnectionRegistryConfig {
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using Factory = std::function<std::shared_ptr<DeviceClient>(const DeviceClientConfig&, TotpCache&)>;

    /// Idle-time clock; replaced in tests.
    Clock clock = [] { return std::chrono::steady_clock::now(); };

    /// Builds new handles. Defaults to a DeviceClient over cpr. May throw
    /// std::invalid_argument for an unusable configuration.
    Factory factory = [](const DeviceClientConfig& config, TotpCache& totp) {
        return std::make_shared<DeviceClient>(config, totp);
    };

    ConnectionRegistryConfig& with_clock(Clock fn) {
        clock = std::move(fn);
        return *this;
    }

    ConnectionRegistryConfig& with_factory(Factory fn) {
        factory = std::move(fn);
        return *this;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConnectionRegistry
// ─────────────────────────────────────────────────────────────────────────────

/// Pool of authenticated DeviceClient handles, at most one per IdentityKey.
///
/// get_connection() reuses a pooled handle when it still authenticates (or
/// can be logged back in), and otherwise builds, authenticates and stores a
/// new one. Idle handles are evicted only when the owner calls
/// clean_unused_connections(); nothing runs in the background.
///
/// Thread-safe. The map lock is held only around map reads and writes;
/// check_auth, login and logout always run outside it. A new handle replaces
/// the entry only if it still holds what the caller saw before creating it.
/// When two callers race to create the same key, the first insert wins; the
/// loser logs out its own handle and returns the pooled one, so a handle
/// already given out is never logged out from under its caller.
///
/// Logout during close and eviction is best-effort: failures are logged and
/// the entry is removed regardless.
///
/// Usage:
///   TotpCache totp(make_totp_generator());
///   ConnectionRegistry registry(totp);
///
///   auto client = registry.get_connection(
///       DeviceClientConfig{.hostname = "pikvm.local", .username = "admin",
///                          .password = "admin"});
///   if (client) {
///       auto info = (*client)->get("/api/info");
///   }
///
class ConnectionRegistry {
public:
    using ClientPtr = std::shared_ptr<DeviceClient>;

    explicit ConnectionRegistry(TotpCache& totp, ConnectionRegistryConfig config = {});

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;
    ConnectionRegistry(ConnectionRegistry&&) = delete;
    ConnectionRegistry& operator=(ConnectionRegistry&&) = delete;

    ~ConnectionRegistry() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Acquisition
    // ─────────────────────────────────────────────────────────────────────────

    /// Pooled handle for config's identity, or a freshly authenticated one.
    ///
    /// Fails with SecondFactorUnavailable when a secret is configured but the
    /// TOTP cache has no generator, and with TransportError when the device
    /// cannot be reached while creating a new handle. A new handle whose
    /// login is refused is still stored and returned; the first operation on
    /// it reports the failure.
    [[nodiscard]] DeviceResult<ClientPtr> get_connection(
        const DeviceClientConfig& config,
        bool force_new = false
    );

    [[nodiscard]] DeviceResult<ClientPtr> get_connection(
        const std::string& hostname,
        const std::string& username,
        const std::string& password,
        const std::optional<std::string>& secret = std::nullopt,
        Scheme scheme = Scheme::Https,
        bool verify_tls = false,
        bool force_new = false
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Release
    // ─────────────────────────────────────────────────────────────────────────

    /// Remove and log out one entry. Returns whether it existed.
    bool close_connection(
        const std::string& hostname,
        const std::string& username,
        Scheme scheme = Scheme::Https
    );

    /// Remove and log out every entry. Returns the number removed.
    std::size_t close_all_connections();

    /// Remove entries idle for strictly longer than max_idle.
    std::size_t clean_unused_connections(std::chrono::seconds max_idle = std::chrono::seconds{300});

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t get_total_connections() const;

    [[nodiscard]] bool has_connection(
        const std::string& hostname,
        const std::string& username,
        Scheme scheme = Scheme::Https
    ) const;

private:
    struct Entry {
        ClientPtr client;
        std::chrono::steady_clock::time_point last_used;
    };

    [[nodiscard]] std::optional<ClientPtr> lookup(const IdentityKey& key) const;
    [[nodiscard]] bool revalidate(const IdentityKey& key, const ClientPtr& client);
    [[nodiscard]] DeviceResult<ClientPtr> create(
        const IdentityKey& key,
        const DeviceClientConfig& config,
        const ClientPtr& replaces
    );
    void touch(const IdentityKey& key, const ClientPtr& client);

    // Stores client if the entry still holds `replaces` (null: no entry).
    // Returns the handle left in the pool.
    [[nodiscard]] ClientPtr store(const IdentityKey& key, ClientPtr client, const ClientPtr& replaces);

    static void logout_quietly(const std::string& label, const ClientPtr& client);

    TotpCache& totp_;
    ConnectionRegistryConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<IdentityKey, Entry, IdentityKeyHash> pool_;
};

}  // namespace kvmpp
