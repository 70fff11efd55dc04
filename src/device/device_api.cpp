#include "kvmpp/device/device_api.hpp"
#include "kvmpp/log/logger.hpp"

#include <array>
#include <fstream>
#include <iterator>

namespace kvmpp {

namespace {

constexpr std::array<AtxPowerAction, 4> all_power_actions = {
    AtxPowerAction::On, AtxPowerAction::Off, AtxPowerAction::OffHard, AtxPowerAction::ResetHard
};

constexpr std::array<AtxButton, 3> all_buttons = {
    AtxButton::Power, AtxButton::PowerLong, AtxButton::Reset
};

Json unwrap_result(Json reply) {
    if (reply.is_object()) {
        const auto it = reply.find("result");
        if (it != reply.end()) {
            return std::move(*it);
        }
    }
    return reply;
}

std::string flag(bool value) {
    return value ? "1" : "0";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Enum Parsing
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<AtxPowerAction> parse_atx_power_action(std::string_view text) {
    for (const auto action : all_power_actions) {
        if (to_string(action) == text) {
            return action;
        }
    }
    return tl::unexpected(DeviceError::invalid_argument(
        "Invalid ATX power action: " + std::string(text)));
}

DeviceResult<AtxButton> parse_atx_button(std::string_view text) {
    for (const auto button : all_buttons) {
        if (to_string(button) == text) {
            return button;
        }
    }
    return tl::unexpected(DeviceError::invalid_argument(
        "Invalid ATX button: " + std::string(text)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Plumbing
// ─────────────────────────────────────────────────────────────────────────────

DeviceApi::DeviceApi(DeviceClient& client, TotpRetryPolicy policy)
    : client_(client)
    , policy_(policy)
{}

DeviceResult<Json> DeviceApi::get_json(const std::string& path, const QueryParams& params) {
    return with_totp_retry(client_, [&](DeviceClient& c) {
        return c.get(path, params);
    }, policy_).map(unwrap_result);
}

DeviceResult<Json> DeviceApi::post_json(const std::string& path, const QueryParams& params) {
    return with_totp_retry(client_, [&](DeviceClient& c) {
        return c.post(path, params);
    }, policy_).map(unwrap_result);
}

DeviceResult<std::string> DeviceApi::get_text(const std::string& path, const QueryParams& params) {
    return with_totp_retry(client_, [&](DeviceClient& c) {
        return c.get_raw(path, params);
    }, policy_);
}

// ─────────────────────────────────────────────────────────────────────────────
// System
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceApi::system_info(const std::vector<std::string>& fields) {
    QueryParams params;
    if (fields.empty() == false) {
        std::string joined;
        for (const auto& field : fields) {
            if (joined.empty() == false) {
                joined += ",";
            }
            joined += field;
        }
        params.emplace_back("fields", std::move(joined));
    }
    return get_json("/api/info", params);
}

DeviceResult<std::string> DeviceApi::system_log(std::optional<std::chrono::seconds> seek) {
    QueryParams params;
    if (seek.has_value() && seek->count() > 0) {
        params.emplace_back("seek", std::to_string(seek->count()));
    }
    return get_text("/api/log", params);
}

DeviceResult<std::string> DeviceApi::prometheus_metrics() {
    return get_text("/api/export/prometheus/metrics");
}

// ─────────────────────────────────────────────────────────────────────────────
// ATX
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceApi::atx_state() {
    return get_json("/api/atx");
}

DeviceResult<Json> DeviceApi::set_atx_power(AtxPowerAction action, bool wait) {
    QueryParams params{{"action", std::string(to_string(action))}};
    if (wait) {
        params.emplace_back("wait", "1");
    }
    return post_json("/api/atx/power", params);
}

DeviceResult<Json> DeviceApi::click_atx_button(AtxButton button, bool wait) {
    QueryParams params{{"button", std::string(to_string(button))}};
    if (wait) {
        params.emplace_back("wait", "1");
    }
    return post_json("/api/atx/click", params);
}

// ─────────────────────────────────────────────────────────────────────────────
// Mass Storage
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceApi::msd_state() {
    return get_json("/api/msd");
}

DeviceResult<Json> DeviceApi::upload_msd_image(
    const std::filesystem::path& local_path,
    const std::optional<std::string>& image_name
) {
    std::error_code ec;
    const bool is_file = std::filesystem::is_regular_file(local_path, ec);
    if (is_file == false) {
        return tl::unexpected(DeviceError::invalid_argument(
            "Image file not found: " + local_path.string()));
    }

    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        return tl::unexpected(DeviceError::invalid_argument(
            "Cannot open image file: " + local_path.string()));
    }
    const std::string data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};

    const bool has_name = image_name.has_value() && (image_name->empty() == false);
    const std::string name = has_name ? *image_name : local_path.filename().string();

    KVMPP_LOG_INFO(std::format("Uploading MSD image {} ({} bytes)", name, data.size()));

    const QueryParams params{{"image", name}};
    return with_totp_retry(client_, [&](DeviceClient& c) {
        return c.post_body("/api/msd/write", data, "application/octet-stream", params);
    }, policy_).map(unwrap_result);
}

DeviceResult<Json> DeviceApi::upload_msd_remote(
    const std::string& url,
    const std::optional<std::string>& image_name,
    std::chrono::seconds timeout
) {
    QueryParams params{
        {"url", url},
        {"timeout", std::to_string(timeout.count())}
    };
    if (image_name.has_value() && image_name->empty() == false) {
        params.emplace_back("image", *image_name);
    }
    return post_json("/api/msd/write_remote", params);
}

DeviceResult<Json> DeviceApi::set_msd_params(
    const std::string& image,
    bool cdrom,
    std::optional<bool> rw
) {
    QueryParams params{
        {"image", image},
        {"cdrom", flag(cdrom)}
    };
    if (rw.has_value() && cdrom == false) {
        params.emplace_back("rw", flag(*rw));
    }
    return post_json("/api/msd/set_params", params);
}

DeviceResult<Json> DeviceApi::connect_msd(bool connected) {
    return post_json("/api/msd/set_connected", {{"connected", flag(connected)}});
}

DeviceResult<Json> DeviceApi::remove_msd_image(const std::string& image) {
    return post_json("/api/msd/remove", {{"image", image}});
}

DeviceResult<Json> DeviceApi::reset_msd() {
    return post_json("/api/msd/reset");
}

// ─────────────────────────────────────────────────────────────────────────────
// GPIO
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceApi::gpio_state() {
    return get_json("/api/gpio");
}

DeviceResult<Json> DeviceApi::switch_gpio_channel(const std::string& channel, bool state, bool wait) {
    QueryParams params{
        {"channel", channel},
        {"state", flag(state)}
    };
    if (wait) {
        params.emplace_back("wait", "1");
    }
    return post_json("/api/gpio/switch", params);
}

DeviceResult<Json> DeviceApi::pulse_gpio_channel(
    const std::string& channel,
    std::chrono::milliseconds delay,
    bool wait
) {
    QueryParams params{{"channel", channel}};
    if (delay.count() > 0) {
        // kvmd takes fractional seconds
        params.emplace_back("delay", std::format("{}", static_cast<double>(delay.count()) / 1000.0));
    }
    if (wait) {
        params.emplace_back("wait", "1");
    }
    return post_json("/api/gpio/pulse", params);
}

// ─────────────────────────────────────────────────────────────────────────────
// Streamer
// ─────────────────────────────────────────────────────────────────────────────

DeviceResult<Json> DeviceApi::streamer_state() {
    return get_json("/api/streamer");
}

DeviceResult<std::string> DeviceApi::streamer_snapshot(bool ocr) {
    QueryParams params{{"allow_offline", "1"}};
    if (ocr) {
        params.emplace_back("ocr", "1");
    }
    return get_text("/api/streamer/snapshot", params);
}

}  // namespace kvmpp
