/**
 * @file retry_policy.hpp
 * @brief bounded exponential backoff, decoupled from whoever makes the call
 *
 * the policy only answers two questions: "may I try again?" and "how long do
 * I wait first?". run_with_retry() glues it to any callable returning a
 * net::RequestResult, so chunk uploads, assembly calls and capability
 * fetches all retry the same way.
 *
 * delay after attempt n (1-based):
 *   base  = min(initial * multiplier^(n-1), max)
 *   quota = base * quota_factor            (QuotaExceeded only)
 *   jit   = d * (1 - jitter) + d * jitter * U[0,1)
 *   final = max(jit, Retry-After)
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <functional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include "ckw/common/error.hpp"
#include "ckw/common/log.hpp"
#include "ckw/common/timing.hpp"
#include "ckw/config/config.hpp"
#include "ckw/net/chunk_server.hpp"

namespace ckw::upload
{

class RetryPolicy
{
public:
    /// uniform sample in [0, 1), only consulted when jitter > 0
    using JitterSource = std::function<double()>;

    explicit RetryPolicy(const config::UploadSettings &settings, JitterSource jitter_source = {});

    [[nodiscard]] auto max_attempts() const noexcept -> std::uint32_t
    {
        return max_attempts_;
    }

    /**
     * @brief true when the error is transient and attempts remain
     */
    [[nodiscard]] auto should_retry(const Error &error, std::uint32_t attempts_made) const noexcept -> bool;

    /**
     * @brief wait before the next attempt
     *
     * @param[in] attempts_made attempts already performed (>= 1)
     * @param[in] kind classification of the last failure
     * @param[in] retry_after server-requested minimum (0 when absent)
     */
    [[nodiscard]] auto delay_after(std::uint32_t attempts_made, ErrorKind kind,
                                   std::chrono::seconds retry_after = std::chrono::seconds{0}) const
        -> std::chrono::milliseconds;

private:
    std::uint32_t             max_attempts_{1U};
    config::BackoffSettings   backoff_{};
    JitterSource              jitter_source_{};
};

/**
 * @brief calls `call` until success, a non-retryable failure, exhaustion or stop
 *
 * ⚠️ IMPURE FUNCTION (sleeps via timing, logs)
 *
 * @param[out] attempts_out when non-null, receives the number of attempts made
 * @return the last result (a Cancelled failure when stop was requested first)
 */
template <typename Call>
[[nodiscard]] auto run_with_retry(const RetryPolicy &policy, const Timing &timing, std::stop_token stop,
                                  std::string_view what, Call &&call, std::uint32_t *attempts_out = nullptr)
    -> decltype(call())
{
    std::uint32_t attempts = 0U;
    while (true)
    {
        if (stop.stop_requested())
        {
            if (attempts_out != nullptr)
            {
                *attempts_out = attempts;
            }
            return std::unexpected(
                net::RequestFailure{make_error(ErrorKind::Cancelled, "run cancelled", {std::string{what}})});
        }

        ++attempts;
        auto result = call();
        if (result || !policy.should_retry(result.error().error, attempts))
        {
            if (attempts_out != nullptr)
            {
                *attempts_out = attempts;
            }
            return result;
        }

        const auto &failure = result.error();
        const auto  delay   = policy.delay_after(attempts, failure.error.kind, failure.retry_after);
        log::warn("retry", std::format("{} attempt {}/{} failed ({}), retrying in {} ms", what, attempts,
                                       policy.max_attempts(), describe(failure.error), delay.count()));
        timing.sleep(delay, stop);
    }
}

} // namespace ckw::upload
