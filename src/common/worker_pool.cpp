/**
 * @file worker_pool.cpp
 * @brief mutex + condition variable work queue
 */
#include "ckw/common/worker_pool.hpp"

#include <stdexcept>
#include <utility>

namespace ckw
{

WorkerPool::WorkerPool(std::size_t size)
{
    if (size == 0U)
    {
        throw std::invalid_argument("worker pool size must be > 0");
    }
    threads_.reserve(size);
    for (std::size_t i = 0; i < size; ++i)
    {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool()
{
    {
        const std::lock_guard lock{mutex_};
        stop_ = true;
    }
    work_cv_.notify_all();
    for (auto &thread : threads_)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }
}

void WorkerPool::submit(std::function<void()> task)
{
    {
        const std::lock_guard lock{mutex_};
        tasks_.push(std::move(task));
    }
    work_cv_.notify_one();
}

void WorkerPool::wait_idle()
{
    std::unique_lock lock{mutex_};
    idle_cv_.wait(lock, [&] { return tasks_.empty() && active_ == 0U; });
}

void WorkerPool::worker_loop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock lock{mutex_};
            work_cv_.wait(lock, [&] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty())
            {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        task();

        {
            const std::lock_guard lock{mutex_};
            --active_;
            if (tasks_.empty() && active_ == 0U)
            {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace ckw
