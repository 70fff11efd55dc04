#ifndef KVMPP_DEVICE_DEVICE_API_HPP
#define KVMPP_DEVICE_DEVICE_API_HPP

#include "kvmpp/auth/totp_retry.hpp"
#include "kvmpp/device/device_client.hpp"
#include "kvmpp/device/device_error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// ATX Enums
// ─────────────────────────────────────────────────────────────────────────────

enum class AtxPowerAction {
    On,
    Off,
    OffHard,
    ResetHard
};

enum class AtxButton {
    Power,
    PowerLong,
    Reset
};

[[nodiscard]] constexpr std::string_view to_string(AtxPowerAction action) noexcept {
    switch (action) {
        case AtxPowerAction::On:        return "on";
        case AtxPowerAction::Off:       return "off";
        case AtxPowerAction::OffHard:   return "off_hard";
        case AtxPowerAction::ResetHard: return "reset_hard";
    }
    return "on";
}

[[nodiscard]] constexpr std::string_view to_string(AtxButton button) noexcept {
    switch (button) {
        case AtxButton::Power:     return "power";
        case AtxButton::PowerLong: return "power_long";
        case AtxButton::Reset:     return "reset";
    }
    return "power";
}

[[nodiscard]] DeviceResult<AtxPowerAction> parse_atx_power_action(std::string_view text);
[[nodiscard]] DeviceResult<AtxButton> parse_atx_button(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// DeviceApi
// ─────────────────────────────────────────────────────────────────────────────
// Typed wrappers over the kvmd endpoints. Every call goes through
// with_totp_retry, so a code that expires mid-request is refreshed and the
// call repeated once (or per the policy).
//
// JSON calls return the "result" member when the reply has one, else the
// whole reply. The DeviceClient must outlive the DeviceApi.

class DeviceApi {
public:
    explicit DeviceApi(DeviceClient& client, TotpRetryPolicy policy = {});

    // ─────────────────────────────────────────────────────────────────────────
    // System
    // ─────────────────────────────────────────────────────────────────────────

    /// GET /api/info, optionally restricted to some top-level fields.
    [[nodiscard]] DeviceResult<Json> system_info(const std::vector<std::string>& fields = {});

    /// GET /api/log as text; `seek` limits it to the last N seconds.
    [[nodiscard]] DeviceResult<std::string> system_log(
        std::optional<std::chrono::seconds> seek = std::nullopt
    );

    /// Prometheus exposition text.
    [[nodiscard]] DeviceResult<std::string> prometheus_metrics();

    // ─────────────────────────────────────────────────────────────────────────
    // ATX
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceResult<Json> atx_state();
    [[nodiscard]] DeviceResult<Json> set_atx_power(AtxPowerAction action, bool wait = true);
    [[nodiscard]] DeviceResult<Json> click_atx_button(AtxButton button, bool wait = true);

    // ─────────────────────────────────────────────────────────────────────────
    // Mass Storage
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceResult<Json> msd_state();

    /// Upload a local file. The image name defaults to the file name.
    [[nodiscard]] DeviceResult<Json> upload_msd_image(
        const std::filesystem::path& local_path,
        const std::optional<std::string>& image_name = std::nullopt
    );

    /// Have the device download an image itself.
    [[nodiscard]] DeviceResult<Json> upload_msd_remote(
        const std::string& url,
        const std::optional<std::string>& image_name = std::nullopt,
        std::chrono::seconds timeout = std::chrono::seconds{10}
    );

    /// `rw` is only sent for flash (non-cdrom) mode.
    [[nodiscard]] DeviceResult<Json> set_msd_params(
        const std::string& image,
        bool cdrom = true,
        std::optional<bool> rw = std::nullopt
    );

    [[nodiscard]] DeviceResult<Json> connect_msd(bool connected = true);
    [[nodiscard]] DeviceResult<Json> remove_msd_image(const std::string& image);
    [[nodiscard]] DeviceResult<Json> reset_msd();

    // ─────────────────────────────────────────────────────────────────────────
    // GPIO
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceResult<Json> gpio_state();
    [[nodiscard]] DeviceResult<Json> switch_gpio_channel(const std::string& channel, bool state, bool wait = true);

    /// A zero delay uses the channel's configured pulse length.
    [[nodiscard]] DeviceResult<Json> pulse_gpio_channel(
        const std::string& channel,
        std::chrono::milliseconds delay = std::chrono::milliseconds{0},
        bool wait = true
    );

    // ─────────────────────────────────────────────────────────────────────────
    // Streamer
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] DeviceResult<Json> streamer_state();

    /// JPEG bytes, or recognized text with `ocr`.
    [[nodiscard]] DeviceResult<std::string> streamer_snapshot(bool ocr = false);

private:
    [[nodiscard]] DeviceResult<Json> get_json(const std::string& path, const QueryParams& params = {});
    [[nodiscard]] DeviceResult<Json> post_json(const std::string& path, const QueryParams& params = {});
    [[nodiscard]] DeviceResult<std::string> get_text(const std::string& path, const QueryParams& params = {});

    DeviceClient& client_;
    TotpRetryPolicy policy_;
};

}  // namespace kvmpp

#endif  // KVMPP_DEVICE_DEVICE_API_HPP
