#include "kvmpp/auth/totp_cache.hpp"
#include "kvmpp/log/logger.hpp"

#include <algorithm>

namespace kvmpp {

TotpCache::TotpCache(std::shared_ptr<ITotpGenerator> generator, TotpCacheConfig config)
    : generator_(std::move(generator))
    , config_(std::move(config))
{
    if (!config_.clock) {
        config_.clock = [] { return std::chrono::system_clock::now(); };
    }
}

std::chrono::sys_seconds TotpCache::now_seconds() const {
    return std::chrono::floor<std::chrono::seconds>(config_.clock());
}

DeviceResult<std::string> TotpCache::get_code(const std::string& secret, bool refresh) {
    if (!generator_) {
        return tl::unexpected(DeviceError::second_factor_unavailable());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_seconds();

    if (refresh == false) {
        const auto it = entries_.find(secret);
        const bool cached = (it != entries_.end());
        if (cached && now < it->second.expiry - config_.safety_buffer) {
            return it->second.code;
        }
    }

    auto code = generator_->generate(secret, now);
    if (!code) {
        return tl::unexpected(code.error());
    }

    // End of the current step, whole seconds
    const auto period = generator_->period();
    const auto since_epoch = now.time_since_epoch();
    const auto expiry = now + period - (since_epoch % period);

    entries_[secret] = Entry{*code, expiry};
    KVMPP_LOG_DEBUG(std::format(
        "TOTP code {} ({}s left in step)",
        refresh ? "refreshed" : "generated",
        (expiry - now).count()
    ));
    return *code;
}

std::chrono::seconds TotpCache::time_remaining(const std::string& secret) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(secret);
    if (it == entries_.end()) {
        return std::chrono::seconds{0};
    }
    const auto remaining = it->second.expiry - now_seconds();
    return std::max(std::chrono::seconds{0}, remaining);
}

std::size_t TotpCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace kvmpp
