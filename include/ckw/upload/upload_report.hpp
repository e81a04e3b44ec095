/**
 * @file upload_report.hpp
 * @brief single-consumer reducer that turns terminal states into the run summary
 *
 * workers never touch the outcome map directly. `record()` pushes an event
 * onto a mutex/condvar queue and one reducer thread folds events into the
 * map. `finish()` closes the queue, joins the reducer and hands back a
 * RunSummary. only after that point is the data readable, so there are no
 * partial reads racing writers.
 *
 * example:
 * @code
 * ckw::upload::UploadReport report;
 * report.record(artifact.id, artifact.name, artifact.format.format, state);
 * const auto summary = report.finish();
 * // summary.completed / failed / timed_out sorted by name uwu
 * @endcode
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "ckw/collect/artifact.hpp"

namespace ckw::upload
{

struct ArtifactOutcome
{
    ArtifactId    id{0U};
    std::string   name;
    std::string   format;
    AssemblyState state{};
};

/**
 * @brief run-wide totals printed under the per-artifact lists
 */
struct RunCounters
{
    std::size_t   artifacts_found{0U};
    std::size_t   duplicates_collapsed{0U};
    std::size_t   unique_chunks{0U};
    std::size_t   chunks_already_on_server{0U};
    std::size_t   batches_sent{0U};
    std::size_t   batches_failed{0U};
    std::uint64_t bytes_sent{0U};
    std::size_t   retries{0U};
    std::size_t   diagnostics{0U};
};

struct RunSummary
{
    std::vector<ArtifactOutcome> completed;
    std::vector<ArtifactOutcome> failed;     ///< hard failures, reason in state.error
    std::vector<ArtifactOutcome> timed_out;  ///< AssemblyTimeout, reported apart from failures
    std::vector<ArtifactOutcome> pending;    ///< accepted, server still processing (no-wait runs)
    std::size_t                  duplicate_records{0U};
    RunCounters                  counters{};

    [[nodiscard]] auto total() const noexcept -> std::size_t
    {
        return completed.size() + failed.size() + timed_out.size() + pending.size();
    }

    /**
     * @brief exit classification helper
     *
     * @param[in] timeouts_are_failures whether timed-out artifacts fail the run
     */
    [[nodiscard]] auto has_failures(bool timeouts_are_failures) const noexcept -> bool
    {
        return !failed.empty() || (timeouts_are_failures && !timed_out.empty());
    }

    /**
     * @brief true when any failure is a cancellation
     */
    [[nodiscard]] auto was_cancelled() const noexcept -> bool;
};

class UploadReport
{
public:
    UploadReport();
    ~UploadReport();

    UploadReport(const UploadReport &)                    = delete;
    auto operator=(const UploadReport &) -> UploadReport & = delete;

    /**
     * @brief queues a terminal state for one artifact (safe from any thread)
     *
     * @return false when the state is not terminal or the report is closed
     *
     * a second record for the same id is dropped by the reducer (first one
     * wins) and counted in RunSummary::duplicate_records.
     */
    auto record(ArtifactId id, std::string name, std::string format, AssemblyState state) -> bool;

    /**
     * @brief closes the queue, joins the reducer and builds the summary
     *
     * ⚠️ IMPURE FUNCTION (joins the reducer thread)
     *
     * later calls return the same summary; counters are left zeroed for the
     * orchestrator to fill in.
     */
    [[nodiscard]] auto finish() -> RunSummary;

private:
    void reduce();

    std::mutex                  mutex_{};
    std::condition_variable     cv_{};
    std::deque<ArtifactOutcome> queue_{};
    bool                        closed_{false};

    // reducer-owned until the thread is joined
    std::map<ArtifactId, ArtifactOutcome> outcomes_{};
    std::size_t                           duplicates_{0U};

    std::optional<RunSummary> summary_{};
    std::thread               reducer_{};
};

} // namespace ckw::upload
