#pragma once

#include "kvmpp/auth/totp.hpp"
#include "kvmpp/auth/totp_cache.hpp"
#include "kvmpp/session/connection_registry.hpp"

#include <memory>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// SessionContextConfig
// ─────────────────────────────────────────────────────────────────────────────

struct SessionContextConfig {
    /// TOTP engine shared by every connection. Null disables second-factor
    /// logins (get_connection then fails for configs carrying a secret).
    std::shared_ptr<ITotpGenerator> totp_generator = make_totp_generator();

    TotpCacheConfig totp;

    ConnectionRegistryConfig registry;

    /// Close every pooled connection when the context is destroyed.
    bool close_on_destroy{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// SessionContext
// ─────────────────────────────────────────────────────────────────────────────
// Process-wide session state: one TOTP cache and one connection registry.
// Construct it once at startup and pass it by reference to whatever needs
// connections.

class SessionContext {
public:
    explicit SessionContext(SessionContextConfig config = {});
    ~SessionContext();

    SessionContext(const SessionContext&) = delete;
    SessionContext& operator=(const SessionContext&) = delete;

    [[nodiscard]] TotpCache& totp_cache() noexcept {
        return totp_;
    }

    [[nodiscard]] ConnectionRegistry& registry() noexcept {
        return registry_;
    }

private:
    TotpCache totp_;
    ConnectionRegistry registry_;
    bool close_on_destroy_;
};

}  // namespace kvmpp
