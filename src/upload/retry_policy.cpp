/**
 * @file retry_policy.cpp
 * @brief backoff arithmetic
 */
#include "ckw/upload/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace ckw::upload
{
namespace
{

[[nodiscard]] auto default_jitter() -> double
{
    thread_local std::mt19937_64                  engine{std::random_device{}()};
    thread_local std::uniform_real_distribution<> distribution{0.0, 1.0};
    return distribution(engine);
}

} // namespace

RetryPolicy::RetryPolicy(const config::UploadSettings &settings, JitterSource jitter_source)
    : max_attempts_{std::max<std::uint32_t>(settings.max_attempts, 1U)},
      backoff_{settings.backoff},
      jitter_source_{jitter_source ? std::move(jitter_source) : JitterSource{&default_jitter}}
{
}

auto RetryPolicy::should_retry(const Error &error, std::uint32_t attempts_made) const noexcept -> bool
{
    return is_retryable(error.kind) && attempts_made < max_attempts_;
}

auto RetryPolicy::delay_after(std::uint32_t attempts_made, ErrorKind kind, std::chrono::seconds retry_after) const
    -> std::chrono::milliseconds
{
    const auto exponent = static_cast<double>(std::max<std::uint32_t>(attempts_made, 1U) - 1U);
    const auto initial  = static_cast<double>(backoff_.initial.count());
    const auto ceiling  = static_cast<double>(backoff_.max.count());

    auto delay = std::min(initial * std::pow(backoff_.multiplier, exponent), ceiling);
    if (kind == ErrorKind::QuotaExceeded)
    {
        delay *= backoff_.quota_factor;
    }
    if (backoff_.jitter > 0.0)
    {
        const auto sample = std::clamp(jitter_source_(), 0.0, 1.0);
        delay             = delay * (1.0 - backoff_.jitter) + delay * backoff_.jitter * sample;
    }

    auto result = std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(std::llround(delay))};
    return std::max<std::chrono::milliseconds>(result, retry_after);
}

} // namespace ckw::upload
