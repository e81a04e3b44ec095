/**
 * @file timing.cpp
 * @brief real clock and stop-aware sleeping
 */
#include "ckw/common/timing.hpp"

#include <condition_variable>
#include <mutex>

namespace ckw
{

auto Timing::system() -> Timing
{
    Timing timing;
    timing.now   = [] { return Clock::now(); };
    timing.sleep = [](std::chrono::milliseconds delay, std::stop_token stop)
    {
        std::mutex                  mutex;
        std::condition_variable_any cv;
        std::unique_lock            lock{mutex};
        // returns early when stop is requested, otherwise after the delay
        static_cast<void>(cv.wait_for(lock, stop, delay, [] { return false; }));
    };
    return timing;
}

} // namespace ckw
