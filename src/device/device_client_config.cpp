#include "kvmpp/device/device_client_config.hpp"

namespace kvmpp {

DeviceClientConfig& DeviceClientConfig::with_secret(const std::string& totp_secret) {
    // An empty secret means "no second factor"
    if (totp_secret.empty()) {
        secret.reset();
    } else {
        secret = totp_secret;
    }
    return *this;
}

DeviceClientConfig& DeviceClientConfig::with_scheme(Scheme s) {
    scheme = s;
    return *this;
}

DeviceClientConfig& DeviceClientConfig::with_verify_tls(bool verify) {
    verify_tls = verify;
    return *this;
}

DeviceClientConfig& DeviceClientConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

DeviceClientConfig& DeviceClientConfig::with_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout = timeout;
    return *this;
}

DeviceClientConfig& DeviceClientConfig::with_header(
    const std::string& name,
    const std::string& value
) {
    extra_headers[name] = value;
    return *this;
}

std::string DeviceClientConfig::base_url() const {
    return std::string(to_string(scheme)) + "://" + hostname;
}

}  // namespace kvmpp
