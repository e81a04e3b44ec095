/**
 * @file upload_report.cpp
 * @brief reducer thread and summary bucketing
 */
#include "ckw/upload/upload_report.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "ckw/common/log.hpp"

namespace ckw::upload
{
namespace
{

constexpr std::string_view kComponent = "report";

void sort_by_name(std::vector<ArtifactOutcome> &outcomes)
{
    std::sort(outcomes.begin(), outcomes.end(),
              [](const ArtifactOutcome &lhs, const ArtifactOutcome &rhs)
              {
                  if (lhs.name != rhs.name)
                  {
                      return lhs.name < rhs.name;
                  }
                  return lhs.id < rhs.id;
              });
}

} // namespace

auto RunSummary::was_cancelled() const noexcept -> bool
{
    return std::any_of(failed.begin(), failed.end(),
                       [](const ArtifactOutcome &outcome)
                       { return outcome.state.error && outcome.state.error->kind == ErrorKind::Cancelled; });
}

UploadReport::UploadReport() : reducer_{[this] { reduce(); }}
{
}

UploadReport::~UploadReport()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (reducer_.joinable())
    {
        reducer_.join();
    }
}

auto UploadReport::record(ArtifactId id, std::string name, std::string format, AssemblyState state) -> bool
{
    if (!state.is_terminal())
    {
        log::warn(kComponent, std::format("ignoring non-terminal state {} for {}", to_string(state.phase), name));
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
        {
            log::warn(kComponent, std::format("late record for {} after the run was summarized", name));
            return false;
        }
        queue_.push_back(ArtifactOutcome{id, std::move(name), std::move(format), std::move(state)});
    }
    cv_.notify_one();
    return true;
}

void UploadReport::reduce()
{
    while (true)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty())
        {
            return;
        }
        auto outcome = std::move(queue_.front());
        queue_.pop_front();
        lock.unlock();

        const auto id = outcome.id;
        if (outcomes_.contains(id))
        {
            ++duplicates_;
            log::warn(kComponent, std::format("duplicate terminal state for {} dropped", outcome.name));
            continue;
        }
        outcomes_.emplace(id, std::move(outcome));
    }
}

auto UploadReport::finish() -> RunSummary
{
    if (summary_)
    {
        return *summary_;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
    if (reducer_.joinable())
    {
        reducer_.join();
    }

    RunSummary summary{};
    summary.duplicate_records = duplicates_;
    for (auto &[id, outcome] : outcomes_)
    {
        if (outcome.state.phase == AssemblyPhase::Complete)
        {
            summary.completed.push_back(std::move(outcome));
        }
        else if (outcome.state.phase == AssemblyPhase::Pending)
        {
            summary.pending.push_back(std::move(outcome));
        }
        else if (outcome.state.is_timeout())
        {
            summary.timed_out.push_back(std::move(outcome));
        }
        else
        {
            summary.failed.push_back(std::move(outcome));
        }
    }
    outcomes_.clear();
    sort_by_name(summary.completed);
    sort_by_name(summary.failed);
    sort_by_name(summary.timed_out);
    sort_by_name(summary.pending);

    summary_ = summary;
    return summary;
}

} // namespace ckw::upload
