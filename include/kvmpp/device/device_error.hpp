#ifndef KVMPP_DEVICE_DEVICE_ERROR_HPP
#define KVMPP_DEVICE_DEVICE_ERROR_HPP

#include "kvmpp/transport/http_client.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Device Error Codes
// ─────────────────────────────────────────────────────────────────────────────

enum class DeviceErrorCode {
    AuthenticationRequired,   // 401: no valid session or credentials
    SecondFactorExpired,      // 403 while a TOTP secret is configured
    AuthenticationRejected,   // 403 without a secret: wrong password
    SecondFactorUnavailable,  // Secret configured but no TOTP engine
    TransportError,           // Connect, timeout or TLS failure
    HttpError,                // Any other unexpected status
    ApiError,                 // 2xx body with "ok": false
    InvalidResponse,          // Body could not be interpreted
    InvalidSecret,            // Shared secret is not valid base32
    InvalidArgument           // Caller supplied a value the API refuses
};

[[nodiscard]] constexpr std::string_view to_string(DeviceErrorCode code) noexcept {
    switch (code) {
        case DeviceErrorCode::AuthenticationRequired:  return "authentication required";
        case DeviceErrorCode::SecondFactorExpired:     return "second factor expired";
        case DeviceErrorCode::AuthenticationRejected:  return "authentication rejected";
        case DeviceErrorCode::SecondFactorUnavailable: return "second factor unavailable";
        case DeviceErrorCode::TransportError:          return "transport error";
        case DeviceErrorCode::HttpError:               return "HTTP error";
        case DeviceErrorCode::ApiError:                return "API error";
        case DeviceErrorCode::InvalidResponse:         return "invalid response";
        case DeviceErrorCode::InvalidSecret:           return "invalid secret";
        case DeviceErrorCode::InvalidArgument:         return "invalid argument";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// DeviceError
// ─────────────────────────────────────────────────────────────────────────────

struct DeviceError {
    DeviceErrorCode code;
    std::string message;
    std::optional<int> http_status;  // Set when the failure came from a response

    static DeviceError authentication_required(const std::string& msg = "Authentication required") {
        return {DeviceErrorCode::AuthenticationRequired, msg, 401};
    }

    static DeviceError second_factor_expired(
        const std::string& msg = "Access forbidden; the TOTP code might have expired"
    ) {
        return {DeviceErrorCode::SecondFactorExpired, msg, 403};
    }

    static DeviceError authentication_rejected(
        const std::string& msg = "Access forbidden; check the credentials"
    ) {
        return {DeviceErrorCode::AuthenticationRejected, msg, 403};
    }

    static DeviceError second_factor_unavailable(
        const std::string& msg = "A TOTP secret is configured but no TOTP generator is available"
    ) {
        return {DeviceErrorCode::SecondFactorUnavailable, msg, std::nullopt};
    }

    static DeviceError transport_error(const std::string& msg) {
        return {DeviceErrorCode::TransportError, msg, std::nullopt};
    }

    static DeviceError http_error(int status, const std::string& msg) {
        return {DeviceErrorCode::HttpError, msg, status};
    }

    static DeviceError api_error(const std::string& msg, std::optional<int> status = std::nullopt) {
        return {DeviceErrorCode::ApiError, msg, status};
    }

    static DeviceError invalid_response(const std::string& msg) {
        return {DeviceErrorCode::InvalidResponse, msg, std::nullopt};
    }

    static DeviceError invalid_secret(const std::string& msg = "TOTP secret is not valid base32") {
        return {DeviceErrorCode::InvalidSecret, msg, std::nullopt};
    }

    static DeviceError invalid_argument(const std::string& msg) {
        return {DeviceErrorCode::InvalidArgument, msg, std::nullopt};
    }

    static DeviceError from_client_error(const HttpClientError& err) {
        std::string msg(to_string(err.code));
        if (err.message.empty() == false) {
            msg += ": " + err.message;
        }
        return transport_error(msg);
    }

    [[nodiscard]] std::string describe() const {
        std::string text(to_string(code));
        if (http_status.has_value()) {
            text += " (HTTP " + std::to_string(*http_status) + ")";
        }
        if (message.empty() == false) {
            text += ": " + message;
        }
        return text;
    }
};

template <typename T>
using DeviceResult = tl::expected<T, DeviceError>;

}  // namespace kvmpp

#endif  // KVMPP_DEVICE_DEVICE_ERROR_HPP
