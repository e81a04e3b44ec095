/**
 * @file timing.hpp
 * @brief injectable clock + sleeper so backoff and polling are testable
 *
 * production code uses Timing::system(). tests hand in a virtual clock whose
 * sleep() just advances time and records the requested delay, which is how
 * "retries wait 1 s then 2 s" gets asserted without a single real second
 * going by.
 */
#pragma once

#include <chrono>
#include <functional>
#include <stop_token>

namespace ckw
{

struct Timing
{
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    std::function<TimePoint()>                                   now;
    std::function<void(std::chrono::milliseconds, std::stop_token)> sleep;

    /**
     * @brief steady clock plus an interruptible sleep (wakes early on stop)
     */
    [[nodiscard]] static auto system() -> Timing;
};

} // namespace ckw
