#include "kvmpp/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace kvmpp {

namespace {

// ada reports the protocol with its trailing colon ("https:").
std::string_view strip_colon(std::string_view protocol) {
    if (protocol.ends_with(':')) {
        protocol.remove_suffix(1);
    }
    return protocol;
}

}  // namespace

std::optional<UrlComponents> parse_url(const std::string& url) {
    const auto parsed = ada::parse<ada::url>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    UrlComponents out;
    out.scheme = std::string(strip_colon(parsed->get_protocol()));
    if (out.scheme != "http" && out.scheme != "https") {
        return std::nullopt;
    }

    out.host = std::string(parsed->get_hostname());
    if (out.host.empty()) {
        return std::nullopt;
    }

    out.port = out.is_secure() ? 443 : 80;
    const std::string port_text(parsed->get_port());
    if (port_text.empty() == false) {
        std::uint16_t port = 0;
        const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || end != port_text.data() + port_text.size()) {
            return std::nullopt;
        }
        out.port = port;
        out.explicit_port = true;
    }

    out.path = std::string(parsed->get_pathname());
    if (out.path.empty()) {
        out.path = "/";
    }
    out.query = std::string(parsed->get_search());
    out.fragment = std::string(parsed->get_hash());
    out.has_userinfo = parsed->has_credentials();
    return out;
}

}  // namespace kvmpp
