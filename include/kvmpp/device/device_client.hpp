#ifndef KVMPP_DEVICE_DEVICE_CLIENT_HPP
#define KVMPP_DEVICE_DEVICE_CLIENT_HPP

#include "kvmpp/auth/totp_cache.hpp"
#include "kvmpp/device/device_client_config.hpp"
#include "kvmpp/device/device_error.hpp"
#include "kvmpp/transport/http_client.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace kvmpp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Response Classification
// ─────────────────────────────────────────────────────────────────────────────
// Maps a kvmd response onto the error taxonomy:
//   401                      -> AuthenticationRequired
//   403, secret configured   -> SecondFactorExpired (retryable)
//   403, no secret           -> AuthenticationRejected
//   != expected_status       -> HttpError ("error" field, body text, or "HTTP n")
//   JSON object "ok": false  -> ApiError
// Otherwise the parsed JSON body; a non-JSON body comes back as a JSON string
// and an empty body as null.

[[nodiscard]] DeviceResult<Json> classify_response(
    const HttpClientResponse& response,
    bool has_secret,
    int expected_status = 200
);

// ─────────────────────────────────────────────────────────────────────────────
// DeviceClient
// ─────────────────────────────────────────────────────────────────────────────
// Authenticated HTTP session with one kvmd endpoint.
//
// Credentials travel one of two ways:
//   - the `auth_token` cookie, once login() has succeeded;
//   - X-KVMD-User / X-KVMD-Passwd headers otherwise, where the password
//     carries the current TOTP code appended (no separator).
// The header pair is computed at construction and cached; it goes stale when
// the TOTP step rolls over, which is what refresh_auth_headers() is for.
//
// Thread-safety: token and cached headers are behind a mutex. Network calls
// run without it. The Registry hands one handle to many callers, but a
// handle should be driven by one logical operation at a time, since a
// concurrent logout() or failed check_auth() drops the token under the
// other caller.

class DeviceClient {
public:
    /// Uses the default (cpr) HTTP client.
    /// Throws std::invalid_argument if scheme://hostname is not a valid URL.
    DeviceClient(DeviceClientConfig config, TotpCache& totp);

    /// Injects the HTTP client. Throws std::invalid_argument for an invalid
    /// hostname or a null client.
    DeviceClient(
        DeviceClientConfig config,
        TotpCache& totp,
        std::unique_ptr<IHttpClient> http
    );

    ~DeviceClient() = default;

    DeviceClient(const DeviceClient&) = delete;
    DeviceClient& operator=(const DeviceClient&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Authentication
    // ─────────────────────────────────────────────────────────────────────────

    /// POST /api/auth/login. True on 200 (the session token is kept), false
    /// for any other status. Transport and TOTP failures are errors.
    [[nodiscard]] DeviceResult<bool> login();

    /// GET /api/auth/check, cookie first, then header credentials.
    [[nodiscard]] DeviceResult<bool> check_auth();

    /// POST /api/auth/logout. True if there was no session or it was closed.
    [[nodiscard]] DeviceResult<bool> logout();

    /// Recompute the header credentials with a fresh TOTP code.
    [[nodiscard]] DeviceResult<void> refresh_auth_headers();

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceResult<Json> get(const std::string& path, const QueryParams& params = {});

    [[nodiscard]] DeviceResult<Json> post(
        const std::string& path,
        const QueryParams& params = {},
        int expected_status = 200
    );

    [[nodiscard]] DeviceResult<Json> post_body(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const QueryParams& params = {}
    );

    /// Body as-is, for text and binary endpoints (logs, metrics, snapshots).
    [[nodiscard]] DeviceResult<std::string> get_raw(
        const std::string& path,
        const QueryParams& params = {}
    );

    // ─────────────────────────────────────────────────────────────────────────
    // State
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] const DeviceClientConfig& config() const noexcept {
        return config_;
    }

    [[nodiscard]] bool has_session_token() const;

    [[nodiscard]] std::optional<std::string> session_token() const;

    /// The header credentials currently cached.
    [[nodiscard]] HeaderMap auth_headers() const;

private:
    [[nodiscard]] DeviceResult<HeaderMap> build_auth_headers(bool refresh);
    [[nodiscard]] DeviceResult<HeaderMap> request_headers();
    [[nodiscard]] DeviceResult<std::string> login_password();
    void clear_token();
    [[nodiscard]] std::string describe() const;

    static constexpr const char* token_cookie = "auth_token";

    DeviceClientConfig config_;
    TotpCache& totp_;
    std::unique_ptr<IHttpClient> http_;

    mutable std::mutex mutex_;
    std::optional<std::string> token_;
    HeaderMap headers_;
    bool headers_valid_{false};
};

}  // namespace kvmpp

#endif  // KVMPP_DEVICE_DEVICE_CLIENT_HPP
