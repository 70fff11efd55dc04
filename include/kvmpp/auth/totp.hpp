#pragma once

#include "kvmpp/device/device_error.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// ITotpGenerator
// ─────────────────────────────────────────────────────────────────────────────
// Computes time-based one-time codes from a base32 shared secret. TotpCache
// decides when to call it; implementations hold no per-secret state.

class ITotpGenerator {
public:
    virtual ~ITotpGenerator() = default;

    /// Code for the time step containing `at`.
    [[nodiscard]] virtual DeviceResult<std::string> generate(
        const std::string& secret,
        std::chrono::system_clock::time_point at
    ) const = 0;

    /// Length of one time step.
    [[nodiscard]] virtual std::chrono::seconds period() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// HmacTotpGenerator - RFC 6238 over HMAC-SHA1
// ─────────────────────────────────────────────────────────────────────────────

struct TotpParameters {
    unsigned digits = 6;
    std::chrono::seconds period{30};
};

class HmacTotpGenerator final : public ITotpGenerator {
public:
    /// Throws std::invalid_argument for digits outside 1..9 or a non-positive period.
    explicit HmacTotpGenerator(TotpParameters params = {});

    [[nodiscard]] DeviceResult<std::string> generate(
        const std::string& secret,
        std::chrono::system_clock::time_point at
    ) const override;

    [[nodiscard]] std::chrono::seconds period() const noexcept override {
        return params_.period;
    }

    [[nodiscard]] unsigned digits() const noexcept {
        return params_.digits;
    }

    /// HOTP value (RFC 4226) for a raw key and counter.
    [[nodiscard]] DeviceResult<std::string> hotp(
        const std::vector<std::uint8_t>& key,
        std::uint64_t counter
    ) const;

private:
    TotpParameters params_;
};

/// RFC 4648 base32. Case-insensitive; spaces, '-' and trailing '=' padding
/// are ignored. Returns nullopt for any other character or an empty key.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> decode_base32(std::string_view text);

/// Default engine: 6 digits, 30 second steps.
[[nodiscard]] std::shared_ptr<ITotpGenerator> make_totp_generator();

}  // namespace kvmpp
