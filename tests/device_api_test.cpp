#include <catch2/catch_test_macros.hpp>

#include "kvmpp/device/device_api.hpp"
#include "mocks/fake_kvmd.hpp"
#include "mocks/fake_totp_generator.hpp"
#include "mocks/mock_http_client.hpp"

#include <filesystem>
#include <fstream>

using namespace kvmpp;
using namespace kvmpp::testing;
using namespace std::chrono_literals;

namespace {

struct ApiFixture {
    TotpCache totp{nullptr};
    MockHttpClient* mock = nullptr;
    std::unique_ptr<DeviceClient> client;
    std::unique_ptr<DeviceApi> api;

    ApiFixture() {
        DeviceClientConfig config;
        config.hostname = "kvm.local";
        config.username = "admin";
        config.password = "admin";

        auto http = std::make_unique<MockHttpClient>();
        mock = http.get();
        mock->set_response_handler([](const RecordedRequest&) -> HttpClientResult<HttpClientResponse> {
            return make_json_response(200, R"({"ok": true, "result": {"done": true}})");
        });
        client = std::make_unique<DeviceClient>(std::move(config), totp, std::move(http));
        api = std::make_unique<DeviceApi>(*client);
    }

    RecordedRequest last() const {
        return *mock->last_request();
    }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Enum Parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ATX names round-trip through the parsers", "[api][atx]") {
    REQUIRE(parse_atx_power_action("on").value() == AtxPowerAction::On);
    REQUIRE(parse_atx_power_action("off").value() == AtxPowerAction::Off);
    REQUIRE(parse_atx_power_action("off_hard").value() == AtxPowerAction::OffHard);
    REQUIRE(parse_atx_power_action("reset_hard").value() == AtxPowerAction::ResetHard);

    REQUIRE(parse_atx_button("power").value() == AtxButton::Power);
    REQUIRE(parse_atx_button("power_long").value() == AtxButton::PowerLong);
    REQUIRE(parse_atx_button("reset").value() == AtxButton::Reset);
}

TEST_CASE("ATX parsers reject unknown names", "[api][atx]") {
    auto action = parse_atx_power_action("reboot");
    REQUIRE(action.error().code == DeviceErrorCode::InvalidArgument);
    REQUIRE(action.error().message == "Invalid ATX power action: reboot");

    REQUIRE(parse_atx_button("ON").error().code == DeviceErrorCode::InvalidArgument);
    REQUIRE_FALSE(parse_atx_button("").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// System
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DeviceApi system_info unwraps the result", "[api][system]") {
    ApiFixture f;
    f.mock->queue_json_response(200, R"({"ok": true, "result": {"hw": {"platform": {"type": "rpi"}}}})");

    auto info = f.api->system_info({"hw", "system"});

    REQUIRE(info.has_value());
    REQUIRE((*info)["hw"]["platform"]["type"] == "rpi");
    REQUIRE(f.last().path == "/api/info");
    REQUIRE(f.last().param("fields") == "hw,system");
}

TEST_CASE("DeviceApi system_info without fields sends no filter", "[api][system]") {
    ApiFixture f;
    REQUIRE(f.api->system_info().has_value());
    REQUIRE_FALSE(f.last().param("fields").has_value());
}

TEST_CASE("DeviceApi system_log and metrics return text", "[api][system]") {
    ApiFixture f;

    SECTION("log with seek") {
        f.mock->queue_response(200, "kvmd started\n");
        REQUIRE(f.api->system_log(60s).value() == "kvmd started\n");
        REQUIRE(f.last().path == "/api/log");
        REQUIRE(f.last().param("seek") == "60");
    }

    SECTION("log without seek") {
        f.mock->queue_response(200, "");
        REQUIRE(f.api->system_log().has_value());
        REQUIRE_FALSE(f.last().param("seek").has_value());
    }

    SECTION("metrics") {
        f.mock->queue_response(200, "pikvm_atx_power 1\n");
        REQUIRE(f.api->prometheus_metrics().value() == "pikvm_atx_power 1\n");
        REQUIRE(f.last().path == "/api/export/prometheus/metrics");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ATX
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DeviceApi ATX requests", "[api][atx]") {
    ApiFixture f;

    SECTION("state") {
        REQUIRE(f.api->atx_state().value()["done"] == true);
        REQUIRE(f.last().method == HttpMethod::Get);
        REQUIRE(f.last().path == "/api/atx");
    }

    SECTION("power and wait") {
        REQUIRE(f.api->set_atx_power(AtxPowerAction::OffHard).has_value());
        REQUIRE(f.last().method == HttpMethod::Post);
        REQUIRE(f.last().path == "/api/atx/power");
        REQUIRE(f.last().param("action") == "off_hard");
        REQUIRE(f.last().param("wait") == "1");
    }

    SECTION("power without waiting") {
        REQUIRE(f.api->set_atx_power(AtxPowerAction::On, false).has_value());
        REQUIRE_FALSE(f.last().param("wait").has_value());
    }

    SECTION("click") {
        REQUIRE(f.api->click_atx_button(AtxButton::PowerLong).has_value());
        REQUIRE(f.last().path == "/api/atx/click");
        REQUIRE(f.last().param("button") == "power_long");
    }
}

TEST_CASE("DeviceApi reports ok false as ApiError", "[api][atx]") {
    ApiFixture f;
    f.mock->queue_json_response(200, R"({"ok": false, "error": "AtxOperationError"})");

    auto result = f.api->set_atx_power(AtxPowerAction::On);

    REQUIRE(result.error().code == DeviceErrorCode::ApiError);
    REQUIRE(result.error().message == "API returned error: AtxOperationError");
}

// ═══════════════════════════════════════════════════════════════════════════
// Mass Storage
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DeviceApi MSD parameters", "[api][msd]") {
    ApiFixture f;

    SECTION("state") {
        REQUIRE(f.api->msd_state().has_value());
        REQUIRE(f.last().path == "/api/msd");
    }

    SECTION("cdrom mode omits rw") {
        REQUIRE(f.api->set_msd_params("debian.iso", true, true).has_value());
        REQUIRE(f.last().path == "/api/msd/set_params");
        REQUIRE(f.last().param("image") == "debian.iso");
        REQUIRE(f.last().param("cdrom") == "1");
        REQUIRE_FALSE(f.last().param("rw").has_value());
    }

    SECTION("flash mode sends rw") {
        REQUIRE(f.api->set_msd_params("disk.img", false, true).has_value());
        REQUIRE(f.last().param("cdrom") == "0");
        REQUIRE(f.last().param("rw") == "1");
    }

    SECTION("connect and disconnect") {
        REQUIRE(f.api->connect_msd().has_value());
        REQUIRE(f.last().path == "/api/msd/set_connected");
        REQUIRE(f.last().param("connected") == "1");

        REQUIRE(f.api->connect_msd(false).has_value());
        REQUIRE(f.last().param("connected") == "0");
    }

    SECTION("remove and reset") {
        REQUIRE(f.api->remove_msd_image("old.iso").has_value());
        REQUIRE(f.last().path == "/api/msd/remove");
        REQUIRE(f.last().param("image") == "old.iso");

        REQUIRE(f.api->reset_msd().has_value());
        REQUIRE(f.last().path == "/api/msd/reset");
    }

    SECTION("remote upload") {
        REQUIRE(f.api->upload_msd_remote("https://mirror/x.iso", "x.iso", 30s).has_value());
        REQUIRE(f.last().path == "/api/msd/write_remote");
        REQUIRE(f.last().param("url") == "https://mirror/x.iso");
        REQUIRE(f.last().param("image") == "x.iso");
        REQUIRE(f.last().param("timeout") == "30");
    }
}

TEST_CASE("DeviceApi uploads a local image", "[api][msd]") {
    ApiFixture f;
    const auto path = std::filesystem::temp_directory_path() / "kvmpp_upload_test.img";
    {
        std::ofstream out(path, std::ios::binary);
        out << "BOOTSECTOR";
    }

    SECTION("name defaults to the file name") {
        REQUIRE(f.api->upload_msd_image(path).has_value());
        REQUIRE(f.last().path == "/api/msd/write");
        REQUIRE(f.last().param("image") == "kvmpp_upload_test.img");
        REQUIRE(f.last().body == "BOOTSECTOR");
        REQUIRE(f.last().content_type == "application/octet-stream");
    }

    SECTION("explicit name") {
        REQUIRE(f.api->upload_msd_image(path, std::string("rescue.img")).has_value());
        REQUIRE(f.last().param("image") == "rescue.img");
    }

    std::filesystem::remove(path);
}

TEST_CASE("DeviceApi refuses to upload a missing file", "[api][msd]") {
    ApiFixture f;

    auto result = f.api->upload_msd_image("/nonexistent/kvmpp/image.iso");

    REQUIRE(result.error().code == DeviceErrorCode::InvalidArgument);
    REQUIRE(f.mock->request_count() == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// GPIO and Streamer
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DeviceApi GPIO requests", "[api][gpio]") {
    ApiFixture f;

    SECTION("state") {
        REQUIRE(f.api->gpio_state().has_value());
        REQUIRE(f.last().path == "/api/gpio");
    }

    SECTION("switch") {
        REQUIRE(f.api->switch_gpio_channel("relay1", true).has_value());
        REQUIRE(f.last().path == "/api/gpio/switch");
        REQUIRE(f.last().param("channel") == "relay1");
        REQUIRE(f.last().param("state") == "1");
        REQUIRE(f.last().param("wait") == "1");
    }

    SECTION("pulse with the configured delay") {
        REQUIRE(f.api->pulse_gpio_channel("relay1").has_value());
        REQUIRE(f.last().path == "/api/gpio/pulse");
        REQUIRE_FALSE(f.last().param("delay").has_value());
    }

    SECTION("pulse with a custom delay") {
        REQUIRE(f.api->pulse_gpio_channel("relay1", 1500ms, false).has_value());
        REQUIRE(f.last().param("delay") == "1.5");
        REQUIRE_FALSE(f.last().param("wait").has_value());
    }
}

TEST_CASE("DeviceApi streamer requests", "[api][streamer]") {
    ApiFixture f;

    SECTION("state") {
        REQUIRE(f.api->streamer_state().has_value());
        REQUIRE(f.last().path == "/api/streamer");
    }

    SECTION("snapshot returns raw bytes") {
        const std::string jpeg("\xFF\xD8\xFF\xE0", 4);
        f.mock->queue_response(200, jpeg);
        REQUIRE(f.api->streamer_snapshot().value() == jpeg);
        REQUIRE(f.last().param("allow_offline") == "1");
        REQUIRE_FALSE(f.last().param("ocr").has_value());
    }

    SECTION("snapshot with OCR") {
        f.mock->queue_response(200, "login:");
        REQUIRE(f.api->streamer_snapshot(true).value() == "login:");
        REQUIRE(f.last().param("ocr") == "1");
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Retry Integration
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("DeviceApi retries an expired second factor", "[api][retry]") {
    FakeKvmd kvmd("admin", "admin111111");
    auto generator = std::make_shared<FakeTotpGenerator>("111111");
    TotpCache totp(generator);

    DeviceClientConfig config;
    config.hostname = "kvm.local";
    config.username = "admin";
    config.password = "admin";
    config.with_secret("JBSWY3DPEHPK3PXP");

    DeviceClient client(config, totp, kvmd.make_client());
    DeviceApi api(client);

    generator->set_code("222222");
    kvmd.set_accepted_passwd("admin222222");

    REQUIRE(api.gpio_state().has_value());

    SECTION("a zero budget does not retry") {
        generator->set_code("333333");
        kvmd.set_accepted_passwd("admin333333");

        DeviceApi strict(client, TotpRetryPolicy().with_max_retries(0));
        REQUIRE(strict.gpio_state().error().code == DeviceErrorCode::SecondFactorExpired);
    }
}
