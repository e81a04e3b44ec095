/**
 * @file manual_clock.hpp
 * @brief fake time for backoff and polling tests (no real sleeping, ever)
 *
 * `sleep` advances the clock by exactly the requested delay and records it, so
 * suites can assert the 1s/2s/4s schedule and the total elapsed time straight
 * from the recorded values.
 */
#pragma once

#include <chrono>
#include <mutex>
#include <stop_token>
#include <vector>

#include "ckw/common/timing.hpp"

namespace ckw::test_support
{

class ManualClock
{
public:
    [[nodiscard]] auto timing() -> Timing
    {
        Timing timing{};
        timing.now   = [this] { return now(); };
        timing.sleep = [this](std::chrono::milliseconds delay, std::stop_token) { advance(delay); };
        return timing;
    }

    [[nodiscard]] auto now() const -> Timing::TimePoint
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_;
    }

    void advance(std::chrono::milliseconds delay)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ += delay;
        sleeps_.push_back(delay);
    }

    [[nodiscard]] auto sleeps() const -> std::vector<std::chrono::milliseconds>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

    [[nodiscard]] auto elapsed() const -> std::chrono::milliseconds
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::chrono::duration_cast<std::chrono::milliseconds>(current_ - Timing::TimePoint{});
    }

private:
    mutable std::mutex                     mutex_{};
    Timing::TimePoint                      current_{};
    std::vector<std::chrono::milliseconds> sleeps_{};
};

} // namespace ckw::test_support
