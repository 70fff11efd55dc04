#include <catch2/catch_test_macros.hpp>

#include "kvmpp/transport/http_client.hpp"
#include "kvmpp/transport/http_types.hpp"

using namespace kvmpp;

// ═══════════════════════════════════════════════════════════════════════════
// Headers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("get_header is case-insensitive", "[http][headers]") {
    HeaderMap headers{{"Content-Type", "application/json"}, {"X-KVMD-User", "admin"}};

    REQUIRE(get_header(headers, "content-type") == "application/json");
    REQUIRE(get_header(headers, "CONTENT-TYPE") == "application/json");
    REQUIRE(get_header(headers, "x-kvmd-user") == "admin");
    REQUIRE_FALSE(get_header(headers, "X-KVMD-Passwd").has_value());
    REQUIRE(find_header(headers, "Content-Typ") == headers.end());
}

TEST_CASE("find_param returns the first matching value", "[http][params]") {
    QueryParams params{{"action", "on"}, {"wait", "1"}, {"action", "off"}};

    REQUIRE(find_param(params, "action") == "on");
    REQUIRE(find_param(params, "wait") == "1");
    REQUIRE_FALSE(find_param(params, "fields").has_value());
}

TEST_CASE("HttpMethod to_string", "[http]") {
    REQUIRE(to_string(HttpMethod::Get) == "GET");
    REQUIRE(to_string(HttpMethod::Post) == "POST");
}

// ═══════════════════════════════════════════════════════════════════════════
// URL Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("parse_url accepts device base URLs", "[http][url]") {
    SECTION("https with default port") {
        auto url = parse_url("https://pikvm.local");
        REQUIRE(url.has_value());
        REQUIRE(url->scheme == "https");
        REQUIRE(url->host == "pikvm.local");
        REQUIRE(url->port == 443);
        REQUIRE(url->path == "/");
        REQUIRE(url->query.empty());
        REQUIRE(url->is_secure());
        REQUIRE(url->origin() == "https://pikvm.local");
    }

    SECTION("http with explicit port") {
        auto url = parse_url("http://10.0.0.5:8080/api?x=1");
        REQUIRE(url.has_value());
        REQUIRE(url->port == 8080);
        REQUIRE(url->path == "/api");
        REQUIRE(url->query == "?x=1");
        REQUIRE_FALSE(url->is_secure());
        REQUIRE(url->host_with_port() == "10.0.0.5:8080");
        REQUIRE(url->origin() == "http://10.0.0.5:8080");
    }
}

TEST_CASE("parse_url reports what a device origin must not carry", "[http][url]") {
    REQUIRE(parse_url("https://pikvm.local")->is_bare_origin());
    REQUIRE(parse_url("https://pikvm.local:8443")->is_bare_origin());

    SECTION("default port is not explicit") {
        auto url = parse_url("https://pikvm.local:443");
        REQUIRE(url.has_value());
        REQUIRE(url->explicit_port == false);
        REQUIRE(url->origin() == "https://pikvm.local");
    }

    SECTION("userinfo") {
        auto url = parse_url("https://admin@pikvm.local");
        REQUIRE(url.has_value());
        REQUIRE(url->has_userinfo);
        REQUIRE_FALSE(url->is_bare_origin());
    }

    SECTION("fragment") {
        auto url = parse_url("https://pikvm.local#x");
        REQUIRE(url.has_value());
        REQUIRE(url->fragment == "#x");
        REQUIRE_FALSE(url->is_bare_origin());
    }

    SECTION("empty query or fragment is not reported") {
        REQUIRE(parse_url("https://pikvm.local?")->query.empty());
        REQUIRE(parse_url("https://pikvm.local#")->fragment.empty());
    }

    SECTION("default construction") {
        const UrlComponents blank;
        REQUIRE(blank.port == 0);
        REQUIRE(blank.explicit_port == false);
        REQUIRE(blank.has_userinfo == false);
    }

    SECTION("path or query") {
        REQUIRE_FALSE(parse_url("https://pikvm.local/api")->is_bare_origin());
        REQUIRE_FALSE(parse_url("https://pikvm.local?x=1")->is_bare_origin());
    }
}

TEST_CASE("parse_url rejects unusable URLs", "[http][url]") {
    REQUIRE_FALSE(parse_url("").has_value());
    REQUIRE_FALSE(parse_url("not a url").has_value());
    REQUIRE_FALSE(parse_url("ftp://pikvm.local").has_value());
    REQUIRE_FALSE(parse_url("file:///etc/passwd").has_value());
    REQUIRE_FALSE(parse_url("https://exa mple.com").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Responses and Errors
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("HttpClientResponse helpers", "[http][response]") {
    HttpClientResponse response;
    response.status_code = 200;
    response.headers = {{"content-type", "application/json; charset=utf-8"}};
    response.cookies = {{"auth_token", "abc"}};

    REQUIRE(response.is_success());
    REQUIRE(response.is_json());
    REQUIRE(response.get_cookie("auth_token") == "abc");
    REQUIRE_FALSE(response.get_cookie("session").has_value());

    response.status_code = 403;
    response.headers.clear();
    REQUIRE_FALSE(response.is_success());
    REQUIRE_FALSE(response.is_json());
}

TEST_CASE("HttpClientError factories set the code", "[http][error]") {
    REQUIRE(HttpClientError::connection_failed("x").code == HttpClientError::Code::ConnectionFailed);
    REQUIRE(HttpClientError::timeout("x").code == HttpClientError::Code::Timeout);
    REQUIRE(HttpClientError::ssl_error("x").code == HttpClientError::Code::SslError);
    REQUIRE(HttpClientError::invalid_request("x").code == HttpClientError::Code::InvalidRequest);
    REQUIRE(HttpClientError::unknown("boom").message == "boom");
    REQUIRE(to_string(HttpClientError::Code::Timeout) == "timeout");
}
