#pragma once

#include "kvmpp/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

[[nodiscard]] inline std::string_view to_string(HttpClientError::Code code) noexcept {
    switch (code) {
        case HttpClientError::Code::ConnectionFailed: return "connection failed";
        case HttpClientError::Code::Timeout:          return "timeout";
        case HttpClientError::Code::SslError:         return "TLS error";
        case HttpClientError::Code::InvalidRequest:   return "invalid request";
        case HttpClientError::Code::Unknown:          return "unknown";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Response
// ─────────────────────────────────────────────────────────────────────────────

using CookieMap = std::unordered_map<std::string, std::string>;

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    CookieMap cookies;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }

    [[nodiscard]] bool is_json() const {
        const auto content_type = get_header(headers, "Content-Type");
        const bool found = content_type.has_value();
        if (found == false) return false;
        return content_type->find("application/json") != std::string::npos;
    }

    [[nodiscard]] std::optional<std::string> get_cookie(const std::string& name) const {
        const auto it = cookies.find(name);
        if (it == cookies.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient Interface
// ─────────────────────────────────────────────────────────────────────────────
// Blocking HTTP client bound to one device origin. DeviceClient talks to the
// device only through this interface; tests substitute a scripted mock.
//
// Implementations never throw for network failures: connect, timeout and TLS
// problems come back as HttpClientError.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────────────────────────

    // Origin every path is appended to, e.g. "https://pikvm.local"
    virtual void set_base_url(const std::string& url) = 0;

    // Sent with every request; per-request headers win on conflict
    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    // kvmd ships a self-signed certificate, so callers usually turn this off
    virtual void set_verify_ssl(bool verify) = 0;

    // ─────────────────────────────────────────────────────────────────────────
    // Requests
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const QueryParams& params = {},
        const HeaderMap& headers = {}
    ) = 0;

    // Raw body POST (uploads, empty-body actions)
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const QueryParams& params = {},
        const HeaderMap& headers = {}
    ) = 0;

    // application/x-www-form-urlencoded POST
    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> post_form(
        const std::string& path,
        const FormFields& fields,
        const QueryParams& params = {},
        const HeaderMap& headers = {}
    ) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Function
// ─────────────────────────────────────────────────────────────────────────────
// The default backend is cpr.

std::unique_ptr<IHttpClient> make_http_client();

}  // namespace kvmpp
