#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────
// Header names compare case-insensitively (RFC 7230).

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Query Parameters and Form Fields
// ─────────────────────────────────────────────────────────────────────────────
// Ordered, so requests are reproducible in logs and tests.

using QueryParams = std::vector<std::pair<std::string, std::string>>;
using FormFields = std::vector<std::pair<std::string, std::string>>;

/// Value of the first parameter named `name`, if any.
inline std::optional<std::string> find_param(
    const QueryParams& params,
    std::string_view name
) {
    const auto it = std::ranges::find_if(params,
        [&name](const auto& pair) { return pair.first == name; });
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// kvmd only needs GET (state queries) and POST (actions, auth).

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // "pikvm.local"
    std::uint16_t port{0}; // explicit, or the scheme default
    bool explicit_port = false;
    std::string path;     // always starts with '/'
    std::string query;    // includes leading '?', may be empty
    std::string fragment; // includes leading '#', may be empty
    bool has_userinfo = false;

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    [[nodiscard]] std::string host_with_port() const {
        return host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string origin() const {
        if (explicit_port) {
            return scheme + "://" + host_with_port();
        }
        return scheme + "://" + host;
    }

    // Only scheme, host and port: what a device base URL may contain. An
    // empty "?" or "#" leaves no trace here; check the raw string for those.
    [[nodiscard]] bool is_bare_origin() const {
        return path == "/" && query.empty() && fragment.empty() && has_userinfo == false;
    }
};

/// Parse an http(s) URL with ada (WHATWG rules). Returns nullopt for any
/// other scheme, an empty host, or a string ada rejects. A port equal to the
/// scheme default is normalized away by ada and reported as not explicit.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace kvmpp
