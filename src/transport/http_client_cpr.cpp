#include "kvmpp/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr (libcurl underneath). Every call is a fresh cpr request carrying the
// configured timeouts and TLS verification flag; session state (the auth
// cookie) is managed by DeviceClient, not by curl's cookie jar.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_base_url(const std::string& url) override {
        base_url_ = url;
        while (base_url_.empty() == false && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> get(
        const std::string& path,
        const QueryParams& params,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto response = cpr::Get(
            cpr::Url{*url},
            build_parameters(params),
            build_headers(headers),
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post(
        const std::string& path,
        const std::string& body,
        const std::string& content_type,
        const QueryParams& params,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        auto request_headers = build_headers(headers);
        if (content_type.empty() == false) {
            request_headers["Content-Type"] = content_type;
        }

        auto response = cpr::Post(
            cpr::Url{*url},
            build_parameters(params),
            request_headers,
            cpr::Body{body},
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

    HttpClientResult<HttpClientResponse> post_form(
        const std::string& path,
        const FormFields& fields,
        const QueryParams& params,
        const HeaderMap& headers
    ) override {
        auto url = build_url(path);
        if (!url) {
            return tl::unexpected(url.error());
        }

        cpr::Payload payload{};
        for (const auto& [name, value] : fields) {
            payload.Add(cpr::Pair{name, value});
        }

        auto response = cpr::Post(
            cpr::Url{*url},
            build_parameters(params),
            build_headers(headers),
            payload,
            cpr::ConnectTimeout{connect_timeout_},
            cpr::Timeout{read_timeout_},
            cpr::VerifySsl{verify_ssl_}
        );
        return convert_response(response);
    }

private:
    // Paths are fixed API routes; anything carrying control characters or a
    // parent reference is refused before it reaches curl.
    static bool is_safe_path(const std::string& path) {
        if (path.empty() || path.front() != '/') {
            return false;
        }
        for (unsigned char c : path) {
            if (c < 0x20 || c == 0x7F) {
                return false;
            }
        }
        std::string lower = path;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const bool has_traversal =
            (lower.find("..") != std::string::npos) ||
            (lower.find("%2e%2e") != std::string::npos) ||
            (lower.find("%2e.") != std::string::npos) ||
            (lower.find(".%2e") != std::string::npos);
        return has_traversal == false;
    }

    HttpClientResult<std::string> build_url(const std::string& path) const {
        const bool safe = is_safe_path(path);
        if (safe == false) {
            return tl::unexpected(HttpClientError::invalid_request("Rejected request path: " + path));
        }
        return base_url_ + path;
    }

    cpr::Header build_headers(const HeaderMap& extra_headers) const {
        cpr::Header cpr_headers;
        for (const auto& [name, value] : default_headers_) {
            cpr_headers[name] = value;
        }
        for (const auto& [name, value] : extra_headers) {
            cpr_headers[name] = value;
        }
        return cpr_headers;
    }

    static cpr::Parameters build_parameters(const QueryParams& params) {
        cpr::Parameters cpr_params{};
        for (const auto& [name, value] : params) {
            cpr_params.Add(cpr::Parameter{name, value});
        }
        return cpr_params;
    }

    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        const bool has_error = (response.error.code != cpr::ErrorCode::OK);
        if (has_error) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;

        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        for (const auto& cookie : response.cookies) {
            result.cookies[cookie.GetName()] = cookie.GetValue();
        }

        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool is_ssl_error =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("ssl") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);

        if (is_ssl_error) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OK:
                return HttpClientError::unknown("No error");

            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);

            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);

            default:
                return HttpClientError::connection_failed(msg);
        }
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10000};
    std::chrono::milliseconds read_timeout_{30000};
    bool verify_ssl_{false};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace kvmpp
