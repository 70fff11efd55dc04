#include "kvmpp/device/device_client.hpp"
#include "kvmpp/log/logger.hpp"

#include <stdexcept>

namespace kvmpp {

namespace {

constexpr const char* login_path  = "/api/auth/login";
constexpr const char* check_path  = "/api/auth/check";
constexpr const char* logout_path = "/api/auth/logout";

std::unique_ptr<IHttpClient> require_http(std::unique_ptr<IHttpClient> http) {
    if (!http) {
        throw std::invalid_argument("DeviceClient: HTTP client cannot be null");
    }
    return http;
}

std::string error_text(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Response Classification
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> classify_response(
    const HttpClientResponse& response,
    bool has_secret,
    int expected_status
) {
    const int status = response.status_code;

    if (status == 401) {
        return tl::unexpected(DeviceError::authentication_required());
    }

    if (status == 403) {
        if (has_secret) {
            return tl::unexpected(DeviceError::second_factor_expired());
        }
        return tl::unexpected(DeviceError::authentication_rejected());
    }

    const Json parsed = Json::parse(response.body, nullptr, false);
    const bool is_json = (parsed.is_discarded() == false) && (response.body.empty() == false);

    if (status != expected_status) {
        std::string detail;
        if (is_json && parsed.is_object() && parsed.contains("error")) {
            detail = error_text(parsed["error"]);
        } else if (response.body.empty() == false) {
            detail = response.body;
        } else {
            detail = "HTTP " + std::to_string(status);
        }
        return tl::unexpected(DeviceError::http_error(status, "API request failed: " + detail));
    }

    if (response.body.empty()) {
        return Json(nullptr);
    }

    if (is_json == false) {
        return Json(response.body);
    }

    if (parsed.is_object()) {
        const auto ok = parsed.find("ok");
        const bool api_failed = (ok != parsed.end()) && ok->is_boolean() && (ok->get<bool>() == false);
        if (api_failed) {
            std::string detail = "Unknown API error";
            const auto err = parsed.find("error");
            if (err != parsed.end()) {
                detail = error_text(*err);
            }
            return tl::unexpected(DeviceError::api_error("API returned error: " + detail, status));
        }
    }

    return parsed;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

DeviceClient::DeviceClient(DeviceClientConfig config, TotpCache& totp)
    : DeviceClient(std::move(config), totp, make_http_client())
{}

DeviceClient::DeviceClient(
    DeviceClientConfig config,
    TotpCache& totp,
    std::unique_ptr<IHttpClient> http
)
    : config_(std::move(config))
    , totp_(totp)
    , http_(require_http(std::move(http)))
{
    const auto url = parse_url(config_.base_url());
    const bool has_delimiter = config_.hostname.find_first_of("?#") != std::string::npos;
    if (has_delimiter || url.has_value() == false || url->is_bare_origin() == false) {
        throw std::invalid_argument("Invalid device hostname: " + config_.hostname);
    }

    http_->set_base_url(config_.base_url());
    http_->set_default_headers(config_.extra_headers);
    http_->set_connect_timeout(config_.connect_timeout);
    http_->set_read_timeout(config_.read_timeout);
    http_->set_verify_ssl(config_.verify_tls);

    // Header credentials are computed once up front. A failure here (no TOTP
    // engine, bad secret) is reported when a request first needs them.
    auto headers = build_auth_headers(false);
    if (!headers) {
        KVMPP_LOG_WARN(std::format("{}: header credentials unavailable: {}",
            describe(), headers.error().describe()));
    }
}

std::string DeviceClient::describe() const {
    return config_.username + "@" + config_.hostname;
}

// ─────────────────────────────────────────────────────────────────────────────
// Credentials
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<std::string> DeviceClient::login_password() {
    if (config_.has_secret() == false) {
        return config_.password;
    }
    auto code = totp_.get_code(*config_.secret);
    if (!code) {
        return tl::unexpected(code.error());
    }
    return config_.password + *code;
}

DeviceResult<HeaderMap> DeviceClient::build_auth_headers(bool refresh) {
    std::string passwd = config_.password;
    if (config_.has_secret()) {
        auto code = totp_.get_code(*config_.secret, refresh);
        if (!code) {
            return tl::unexpected(code.error());
        }
        passwd += *code;
    }

    HeaderMap headers{
        {"X-KVMD-User", config_.username},
        {"X-KVMD-Passwd", std::move(passwd)}
    };

    std::lock_guard<std::mutex> lock(mutex_);
    headers_ = headers;
    headers_valid_ = true;
    return headers;
}

DeviceResult<void> DeviceClient::refresh_auth_headers() {
    auto headers = build_auth_headers(true);
    if (!headers) {
        return tl::unexpected(headers.error());
    }
    KVMPP_LOG_DEBUG(std::format("{}: header credentials refreshed", describe()));
    return {};
}

DeviceResult<HeaderMap> DeviceClient::request_headers() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (token_.has_value()) {
            return HeaderMap{{"Cookie", std::string(token_cookie) + "=" + *token_}};
        }
        if (headers_valid_) {
            return headers_;
        }
    }
    return build_auth_headers(false);
}

void DeviceClient::clear_token() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.reset();
}

bool DeviceClient::has_session_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_.has_value();
}

std::optional<std::string> DeviceClient::session_token() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}

HeaderMap DeviceClient::auth_headers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return headers_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Authentication
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<bool> DeviceClient::login() {
    auto passwd = login_password();
    if (!passwd) {
        return tl::unexpected(passwd.error());
    }

    const FormFields fields{
        {"user", config_.username},
        {"passwd", *passwd}
    };

    auto response = http_->post_form(login_path, fields);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }

    if (response->status_code != 200) {
        KVMPP_LOG_WARN(std::format("{}: login refused (HTTP {})", describe(), response->status_code));
        return false;
    }

    auto token = response->get_cookie(token_cookie);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token_ = token;
    }

    if (token.has_value()) {
        KVMPP_LOG_INFO(std::format("{}: logged in, session {}", describe(), redact(*token)));
    } else {
        KVMPP_LOG_INFO(std::format("{}: logged in without a session cookie", describe()));
    }
    return true;
}

DeviceResult<bool> DeviceClient::check_auth() {
    const auto token = session_token();
    if (token.has_value()) {
        const HeaderMap cookie{{"Cookie", std::string(token_cookie) + "=" + *token}};
        auto response = http_->get(check_path, {}, cookie);
        if (!response) {
            return tl::unexpected(DeviceError::from_client_error(response.error()));
        }
        if (response->status_code == 200) {
            return true;
        }
        KVMPP_LOG_DEBUG(std::format("{}: session {} no longer valid", describe(), redact(*token)));
        clear_token();
    }

    auto headers = request_headers();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    auto response = http_->get(check_path, {}, *headers);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }
    return response->status_code == 200;
}

DeviceResult<bool> DeviceClient::logout() {
    const auto token = session_token();
    if (token.has_value() == false) {
        return true;
    }

    const HeaderMap cookie{{"Cookie", std::string(token_cookie) + "=" + *token}};
    auto response = http_->post(logout_path, "", "", {}, cookie);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }

    if (response->status_code == 200) {
        clear_token();
        KVMPP_LOG_INFO(std::format("{}: logged out", describe()));
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceClient::get(const std::string& path, const QueryParams& params) {
    auto headers = request_headers();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    KVMPP_LOG_TRACE(std::format("{}: GET {}", describe(), path));
    auto response = http_->get(path, params, *headers);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }
    return classify_response(*response, config_.has_secret());
}

DeviceResult<Json> DeviceClient::post(
    const std::string& path,
    const QueryParams& params,
    int expected_status
) {
    auto headers = request_headers();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    KVMPP_LOG_TRACE(std::format("{}: POST {}", describe(), path));
    auto response = http_->post(path, "", "", params, *headers);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }
    return classify_response(*response, config_.has_secret(), expected_status);
}

DeviceResult<Json> DeviceClient::post_body(
    const std::string& path,
    const std::string& body,
    const std::string& content_type,
    const QueryParams& params
) {
    auto headers = request_headers();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    KVMPP_LOG_TRACE(std::format("{}: POST {} ({} bytes)", describe(), path, body.size()));
    auto response = http_->post(path, body, content_type, params, *headers);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }
    return classify_response(*response, config_.has_secret());
}

DeviceResult<std::string> DeviceClient::get_raw(const std::string& path, const QueryParams& params) {
    auto headers = request_headers();
    if (!headers) {
        return tl::unexpected(headers.error());
    }

    KVMPP_LOG_TRACE(std::format("{}: GET {} (raw)", describe(), path));
    auto response = http_->get(path, params, *headers);
    if (!response) {
        return tl::unexpected(DeviceError::from_client_error(response.error()));
    }

    // Any status other than the expected one classifies as an error
    if (response->status_code != 200) {
        return tl::unexpected(classify_response(*response, config_.has_secret(), 200).error());
    }
    return std::move(response->body);
}

}  // namespace kvmpp
