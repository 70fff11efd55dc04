#include <catch2/catch_test_macros.hpp>

#include "kvmpp/session/session_context.hpp"
#include "mocks/fake_kvmd.hpp"

using namespace kvmpp;
using namespace kvmpp::testing;

namespace {

SessionContextConfig context_config(FakeKvmd& kvmd) {
    SessionContextConfig config;
    config.registry.with_factory([&kvmd](const DeviceClientConfig& c, TotpCache& totp) {
        return std::make_shared<DeviceClient>(c, totp, kvmd.make_client());
    });
    return config;
}

DeviceClientConfig device_config() {
    DeviceClientConfig config;
    config.hostname = "kvm.local";
    config.username = "admin";
    config.password = "hunter2";
    return config;
}

}  // namespace

TEST_CASE("SessionContext wires the registry to its TOTP cache", "[session]") {
    FakeKvmd kvmd("admin", "hunter2");
    SessionContext context(context_config(kvmd));

    REQUIRE(context.totp_cache().has_generator());
    REQUIRE(context.registry().get_connection(device_config()).has_value());
    REQUIRE(context.registry().get_total_connections() == 1);
}

TEST_CASE("SessionContext closes connections on destruction", "[session]") {
    FakeKvmd kvmd("admin", "hunter2");
    kvmd.set_header_auth(false);

    {
        SessionContext context(context_config(kvmd));
        REQUIRE(context.registry().get_connection(device_config()).has_value());
        REQUIRE(kvmd.active_sessions() == 1);
    }

    REQUIRE(kvmd.active_sessions() == 0);
    REQUIRE(kvmd.logouts() == 1);
}

TEST_CASE("SessionContext can leave sessions open", "[session]") {
    FakeKvmd kvmd("admin", "hunter2");
    kvmd.set_header_auth(false);

    {
        auto config = context_config(kvmd);
        config.close_on_destroy = false;
        SessionContext context(std::move(config));
        REQUIRE(context.registry().get_connection(device_config()).has_value());
    }

    REQUIRE(kvmd.logouts() == 0);
}

TEST_CASE("SessionContext without a TOTP engine refuses second-factor logins", "[session][totp]") {
    FakeKvmd kvmd("admin", "hunter2");
    auto config = context_config(kvmd);
    config.totp_generator = nullptr;
    SessionContext context(std::move(config));

    auto device = device_config();
    device.with_secret("JBSWY3DPEHPK3PXP");

    auto result = context.registry().get_connection(device);
    REQUIRE(result.error().code == DeviceErrorCode::SecondFactorUnavailable);
}
