#ifndef KVMPP_DEVICE_DEVICE_CLIENT_CONFIG_HPP
#define KVMPP_DEVICE_DEVICE_CLIENT_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Scheme
// ─────────────────────────────────────────────────────────────────────────────

enum class Scheme {
    Https,
    Http
};

[[nodiscard]] constexpr std::string_view to_string(Scheme scheme) noexcept {
    switch (scheme) {
        case Scheme::Https: return "https";
        case Scheme::Http:  return "http";
    }
    return "https";
}

// ─────────────────────────────────────────────────────────────────────────────
// DeviceClientConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything needed to talk to one kvmd endpoint as one user.

struct DeviceClientConfig {
    using HeaderMap = std::unordered_map<std::string, std::string>;

    // ─────────────────────────────────────────────────────────────────────────
    // Identity
    // ─────────────────────────────────────────────────────────────────────────

    // Host name or address, optionally with ":port". No scheme.
    std::string hostname;

    std::string username;

    std::string password;

    // Base32 TOTP secret. When set, the current code is appended to the
    // password on every login and header-authenticated request.
    std::optional<std::string> secret;

    Scheme scheme{Scheme::Https};

    // ─────────────────────────────────────────────────────────────────────────
    // Transport
    // ─────────────────────────────────────────────────────────────────────────

    // Devices ship self-signed certificates; verification is opt-in.
    bool verify_tls{false};

    std::chrono::milliseconds connect_timeout{10'000};

    std::chrono::milliseconds read_timeout{30'000};

    // Extra headers sent with every request (User-Agent and the like).
    HeaderMap extra_headers;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder Helpers
    // ─────────────────────────────────────────────────────────────────────────

    DeviceClientConfig& with_secret(const std::string& totp_secret);
    DeviceClientConfig& with_scheme(Scheme s);
    DeviceClientConfig& with_verify_tls(bool verify);
    DeviceClientConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    DeviceClientConfig& with_read_timeout(std::chrono::milliseconds timeout);
    DeviceClientConfig& with_header(const std::string& name, const std::string& value);

    /// "https://pikvm.local"
    [[nodiscard]] std::string base_url() const;

    [[nodiscard]] bool has_secret() const noexcept {
        return secret.has_value() && (secret->empty() == false);
    }
};

}  // namespace kvmpp

#endif  // KVMPP_DEVICE_DEVICE_CLIENT_CONFIG_HPP
