#ifndef KVMPP_AUTH_TOTP_RETRY_HPP
#define KVMPP_AUTH_TOTP_RETRY_HPP

#include "kvmpp/device/device_client.hpp"
#include "kvmpp/device/device_error.hpp"
#include "kvmpp/log/logger.hpp"

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>

namespace kvmpp {

// ─────────────────────────────────────────────────────────────────────────────
// TotpRetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Decides which failures earn another attempt. Only a second-factor expiry
// qualifies: the credentials were right, the code just aged out between
// computing it and the device checking it. Everything else (wrong password,
// transport failure, API error) fails straight through.
//
// Usage:
//   TotpRetryPolicy policy;
//   policy.with_max_retries(2);
//   auto state = with_totp_retry(client, [](DeviceClient& c) {
//       return c.get("/api/atx");
//   }, policy);

class TotpRetryPolicy {
public:
    TotpRetryPolicy() = default;

    /// Retries after the initial attempt.
    TotpRetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    [[nodiscard]] std::size_t max_retries() const noexcept {
        return max_retries_;
    }

    /// @param attempt retries already spent (0 before the first retry)
    [[nodiscard]] bool should_retry(const DeviceError& error, std::size_t attempt) const noexcept {
        const bool within_limit = (attempt < max_retries_);
        if (within_limit == false) {
            return false;
        }
        return is_retryable(error);
    }

    [[nodiscard]] static bool is_retryable(const DeviceError& error) noexcept {
        switch (error.code) {
            case DeviceErrorCode::SecondFactorExpired:
                return true;

            case DeviceErrorCode::AuthenticationRequired:
            case DeviceErrorCode::AuthenticationRejected:
            case DeviceErrorCode::SecondFactorUnavailable:
            case DeviceErrorCode::TransportError:
            case DeviceErrorCode::HttpError:
            case DeviceErrorCode::ApiError:
            case DeviceErrorCode::InvalidResponse:
            case DeviceErrorCode::InvalidSecret:
            case DeviceErrorCode::InvalidArgument:
                return false;
        }
        return false;
    }

private:
    std::size_t max_retries_{1};
};

// ─────────────────────────────────────────────────────────────────────────────
// retry_call
// ─────────────────────────────────────────────────────────────────────────────
// Runs `op` until it succeeds, fails with a non-retryable error, or the
// budget is spent. Between attempts `on_retry` runs; if it fails, its error
// is returned instead of retrying.
//
//   op:           () -> tl::expected<T, E>
//   is_retryable: (const E&) -> bool
//   on_retry:     () -> tl::expected<void, E>

template <typename Op, typename IsRetryable, typename OnRetry>
auto retry_call(
    Op&& op,
    IsRetryable&& is_retryable,
    std::size_t max_retries,
    OnRetry&& on_retry
) -> std::invoke_result_t<Op&> {
    using Result = std::invoke_result_t<Op&>;

    std::size_t attempt = 0;
    while (true) {
        Result result = std::invoke(op);
        if (result.has_value()) {
            return result;
        }

        const bool budget_left = (attempt < max_retries);
        if (budget_left == false || std::invoke(is_retryable, result.error()) == false) {
            return result;
        }

        auto refreshed = std::invoke(on_retry);
        if (!refreshed) {
            return Result(tl::unexpect, refreshed.error());
        }
        ++attempt;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// with_totp_retry
// ─────────────────────────────────────────────────────────────────────────────
// Runs `op(client)`; on a second-factor expiry, forces a fresh TOTP code into
// the client's header credentials and tries again, up to the policy's budget.

template <typename Op>
auto with_totp_retry(
    DeviceClient& client,
    Op&& op,
    const TotpRetryPolicy& policy = {}
) -> std::invoke_result_t<Op&, DeviceClient&> {
    std::size_t retries = 0;
    return retry_call(
        [&]() { return std::invoke(op, client); },
        [&](const DeviceError& error) { return policy.should_retry(error, retries); },
        policy.max_retries(),
        [&]() -> DeviceResult<void> {
            ++retries;
            get_logger().warn_fmt(
                "{}@{}: TOTP code may have expired, retrying ({}/{})",
                client.config().username, client.config().hostname,
                retries, policy.max_retries()
            );
            return client.refresh_auth_headers();
        }
    );
}

}  // namespace kvmpp

#endif  // KVMPP_AUTH_TOTP_RETRY_HPP
