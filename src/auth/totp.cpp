#include "kvmpp/auth/totp.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <array>
#include <format>
#include <stdexcept>

namespace kvmpp {

namespace {

constexpr std::array<std::uint32_t, 10> powers_of_ten = {
    1u, 10u, 100u, 1000u, 10000u, 100000u, 1000000u, 10000000u, 100000000u, 1000000000u
};

int base32_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a';
    if (c >= '2' && c <= '7') return c - '2' + 26;
    return -1;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Base32
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::vector<std::uint8_t>> decode_base32(std::string_view text) {
    std::vector<std::uint8_t> out;
    out.reserve(text.size() * 5 / 8);

    std::uint32_t buffer = 0;
    int bits = 0;
    bool padding_seen = false;

    for (const char c : text) {
        if (c == ' ' || c == '-') {
            continue;
        }
        if (c == '=') {
            padding_seen = true;
            continue;
        }
        // Data after padding is malformed
        if (padding_seen) {
            return std::nullopt;
        }

        const int value = base32_value(c);
        if (value < 0) {
            return std::nullopt;
        }

        buffer = (buffer << 5) | static_cast<std::uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buffer >> bits) & 0xFFu));
        }
    }

    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

// ─────────────────────────────────────────────────────────────────────────────
// HmacTotpGenerator
// ─────────────────────────────────────────────────────────────────────────────

HmacTotpGenerator::HmacTotpGenerator(TotpParameters params)
    : params_(params)
{
    const bool digits_ok = (params_.digits >= 1) && (params_.digits <= 9);
    if (digits_ok == false) {
        throw std::invalid_argument("TOTP digits must be between 1 and 9");
    }
    if (params_.period.count() <= 0) {
        throw std::invalid_argument("TOTP period must be positive");
    }
}

DeviceResult<std::string> HmacTotpGenerator::hotp(
    const std::vector<std::uint8_t>& key,
    std::uint64_t counter
) const {
    std::array<unsigned char, 8> message{};
    for (int i = 7; i >= 0; --i) {
        message[static_cast<std::size_t>(i)] = static_cast<unsigned char>(counter & 0xFFu);
        counter >>= 8;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    const unsigned char* mac = HMAC(EVP_sha1(),
         key.data(), static_cast<int>(key.size()),
         message.data(), message.size(),
         digest.data(), &digest_len);
    if (mac == nullptr || digest_len < 20) {
        return tl::unexpected(DeviceError::second_factor_unavailable("HMAC-SHA1 computation failed"));
    }

    // Dynamic truncation (RFC 4226 section 5.3)
    const std::size_t offset = digest[digest_len - 1] & 0x0Fu;
    const std::uint32_t binary =
        (static_cast<std::uint32_t>(digest[offset] & 0x7Fu) << 24) |
        (static_cast<std::uint32_t>(digest[offset + 1]) << 16) |
        (static_cast<std::uint32_t>(digest[offset + 2]) << 8) |
        static_cast<std::uint32_t>(digest[offset + 3]);

    const std::uint32_t code = binary % powers_of_ten[params_.digits];
    return std::format("{:0{}}", code, params_.digits);
}

DeviceResult<std::string> HmacTotpGenerator::generate(
    const std::string& secret,
    std::chrono::system_clock::time_point at
) const {
    const auto key = decode_base32(secret);
    if (!key) {
        return tl::unexpected(DeviceError::invalid_secret());
    }

    const auto unix_seconds = std::chrono::duration_cast<std::chrono::seconds>(
        at.time_since_epoch()
    ).count();
    if (unix_seconds < 0) {
        return tl::unexpected(DeviceError::invalid_argument("TOTP time precedes the Unix epoch"));
    }

    const auto counter = static_cast<std::uint64_t>(unix_seconds / params_.period.count());
    return hotp(*key, counter);
}

std::shared_ptr<ITotpGenerator> make_totp_generator() {
    return std::make_shared<HmacTotpGenerator>();
}

}  // namespace kvmpp
