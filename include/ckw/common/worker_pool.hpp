/**
 * @file worker_pool.hpp
 * @brief fixed-size thread pool behind every parallel stage uwu
 *
 * tasks are plain callables pulled FIFO from a shared queue. the pool size is
 * the concurrency bound: at most `size()` tasks run at once, which is how the
 * uploader keeps in-flight requests under the configured limit.
 *
 * tasks must not throw (every fallible step in the engine returns
 * std::expected, so a throwing task is a bug and terminates like any other
 * uncaught exception on a std::thread).
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace ckw
{

class WorkerPool
{
public:
    /**
     * @throws std::invalid_argument when size == 0
     */
    explicit WorkerPool(std::size_t size);
    ~WorkerPool();

    WorkerPool(const WorkerPool &)                    = delete;
    auto operator=(const WorkerPool &) -> WorkerPool & = delete;

    void submit(std::function<void()> task);

    /**
     * @brief blocks until the queue is drained and no task is running
     */
    void wait_idle();

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return threads_.size();
    }

private:
    void worker_loop();

    std::mutex                        mutex_{};
    std::condition_variable           work_cv_{};
    std::condition_variable           idle_cv_{};
    std::queue<std::function<void()>> tasks_{};
    std::size_t                       active_{0U};
    bool                              stop_{false};
    std::vector<std::thread>          threads_{};
};

} // namespace ckw
