#include "kvmpp/session/connection_registry.hpp"
#include "kvmpp/log/logger.hpp"

#include <stdexcept>
#include <utility>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

ConnectionRegistry::ConnectionRegistry(TotpCache& totp, ConnectionRegistryConfig config)
    : totp_(totp)
    , config_(std::move(config))
{
    if (!config_.factory) {
        throw std::invalid_argument("ConnectionRegistry: factory cannot be empty");
    }
    if (!config_.clock) {
        config_.clock = [] { return std::chrono::steady_clock::now(); };
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Acquisition
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<ConnectionRegistry::ClientPtr> ConnectionRegistry::get_connection(
    const DeviceClientConfig& config,
    bool force_new
) {
    const auto key = IdentityKey::from_config(config);
    const ClientPtr pooled = lookup(key).value_or(nullptr);

    if (pooled && force_new == false) {
        const bool reusable = revalidate(key, pooled);
        if (reusable) {
            touch(key, pooled);
            KVMPP_LOG_DEBUG(std::format("Reusing pooled connection {}", key.to_string()));
            return pooled;
        }
    }

    const bool needs_totp = config.has_secret();
    if (needs_totp && totp_.has_generator() == false) {
        return tl::unexpected(DeviceError::second_factor_unavailable());
    }

    return create(key, config, pooled);
}

DeviceResult<ConnectionRegistry::ClientPtr> ConnectionRegistry::get_connection(
    const std::string& hostname,
    const std::string& username,
    const std::string& password,
    const std::optional<std::string>& secret,
    Scheme scheme,
    bool verify_tls,
    bool force_new
) {
    DeviceClientConfig config;
    config.hostname = hostname;
    config.username = username;
    config.password = password;
    if (secret.has_value()) {
        config.with_secret(*secret);
    }
    config.with_scheme(scheme).with_verify_tls(verify_tls);
    return get_connection(config, force_new);
}

// A pooled handle is kept if it still authenticates or a single re-login on
// it succeeds. Any failure here only means "build a new one".
bool ConnectionRegistry::revalidate(const IdentityKey& key, const ClientPtr& client) {
    auto authenticated = client->check_auth();
    if (authenticated && *authenticated) {
        return true;
    }
    if (!authenticated) {
        KVMPP_LOG_DEBUG(std::format("Auth probe for {} failed: {}",
            key.to_string(), authenticated.error().describe()));
    }

    auto relogin = client->login();
    if (relogin && *relogin) {
        KVMPP_LOG_INFO(std::format("Re-authenticated pooled connection {}", key.to_string()));
        return true;
    }

    if (!relogin) {
        KVMPP_LOG_WARN(std::format("Re-login for {} failed: {}; creating a new connection",
            key.to_string(), relogin.error().describe()));
    } else {
        KVMPP_LOG_WARN(std::format("Re-login for {} refused; creating a new connection",
            key.to_string()));
    }
    return false;
}

DeviceResult<ConnectionRegistry::ClientPtr> ConnectionRegistry::create(
    const IdentityKey& key,
    const DeviceClientConfig& config,
    const ClientPtr& replaces
) {
    ClientPtr client = config_.factory(config, totp_);
    if (!client) {
        throw std::invalid_argument("ConnectionRegistry: factory returned a null client");
    }

    auto authenticated = client->check_auth();
    if (!authenticated) {
        return tl::unexpected(authenticated.error());
    }

    if (*authenticated == false) {
        auto logged_in = client->login();
        if (!logged_in) {
            return tl::unexpected(logged_in.error());
        }
        if (*logged_in == false) {
            KVMPP_LOG_WARN(std::format("Login to {} refused; storing unauthenticated connection",
                key.to_string()));
        }
    }

    auto pooled = store(key, client, replaces);
    if (pooled != client) {
        KVMPP_LOG_DEBUG(std::format("Connection {} was opened concurrently; using the pooled one",
            key.to_string()));
        logout_quietly(key.to_string(), client);
        return pooled;
    }
    KVMPP_LOG_INFO(std::format("Opened connection {}", key.to_string()));
    return pooled;
}

// ─────────────────────────────────────────────────────────────────────────────
// Map Operations
// ─────────────────────────────────────────────────────────────────────────────

std::optional<ConnectionRegistry::ClientPtr> ConnectionRegistry::lookup(const IdentityKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pool_.find(key);
    if (it == pool_.end()) {
        return std::nullopt;
    }
    return it->second.client;
}

void ConnectionRegistry::touch(const IdentityKey& key, const ClientPtr& client) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pool_.find(key);
    // Closed or replaced while we were probing it
    if (it == pool_.end() || it->second.client != client) {
        return;
    }
    it->second.last_used = config_.clock();
}

ConnectionRegistry::ClientPtr ConnectionRegistry::store(
    const IdentityKey& key,
    ClientPtr client,
    const ClientPtr& replaces
) {
    ClientPtr displaced;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = pool_[key];
        // Another caller stored first; an entry closed meanwhile is free
        const bool superseded = entry.client && entry.client != replaces;
        if (superseded) {
            entry.last_used = config_.clock();
            return entry.client;
        }
        displaced = std::move(entry.client);
        entry.client = client;
        entry.last_used = config_.clock();
    }

    if (displaced) {
        logout_quietly(key.to_string(), displaced);
    }
    return client;
}

void ConnectionRegistry::logout_quietly(const std::string& label, const ClientPtr& client) {
    auto result = client->logout();
    if (!result) {
        KVMPP_LOG_WARN(std::format("Logout from {} failed: {}", label, result.error().describe()));
        return;
    }
    if (*result == false) {
        KVMPP_LOG_WARN(std::format("Logout from {} was refused", label));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Release
// ─────────────────────────────────────────────────────────────────────────────

bool ConnectionRegistry::close_connection(
    const std::string& hostname,
    const std::string& username,
    Scheme scheme
) {
    const IdentityKey key{username, hostname, scheme};
    ClientPtr client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pool_.find(key);
        if (it == pool_.end()) {
            return false;
        }
        client = std::move(it->second.client);
        pool_.erase(it);
    }

    logout_quietly(key.to_string(), client);
    KVMPP_LOG_INFO(std::format("Closed connection {}", key.to_string()));
    return true;
}

std::size_t ConnectionRegistry::close_all_connections() {
    std::vector<std::pair<IdentityKey, ClientPtr>> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed.reserve(pool_.size());
        for (auto& [key, entry] : pool_) {
            removed.emplace_back(key, std::move(entry.client));
        }
        pool_.clear();
    }

    for (const auto& [key, client] : removed) {
        logout_quietly(key.to_string(), client);
    }
    if (removed.empty() == false) {
        KVMPP_LOG_INFO(std::format("Closed {} connection(s)", removed.size()));
    }
    return removed.size();
}

std::size_t ConnectionRegistry::clean_unused_connections(std::chrono::seconds max_idle) {
    std::vector<std::pair<IdentityKey, ClientPtr>> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = config_.clock();
        for (auto it = pool_.begin(); it != pool_.end();) {
            const bool expired = (now - it->second.last_used) > max_idle;
            if (expired) {
                stale.emplace_back(it->first, std::move(it->second.client));
                it = pool_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& [key, client] : stale) {
        logout_quietly(key.to_string(), client);
        KVMPP_LOG_INFO(std::format("Evicted idle connection {}", key.to_string()));
    }
    return stale.size();
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

std::size_t ConnectionRegistry::get_total_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}

bool ConnectionRegistry::has_connection(
    const std::string& hostname,
    const std::string& username,
    Scheme scheme
) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.contains(IdentityKey{username, hostname, scheme});
}

}  // namespace kvmpp
