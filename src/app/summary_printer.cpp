/**
 * @file summary_printer.cpp
 * @brief summary rendering for the chunkwave CLI
 */
#include "ckw/app/summary_printer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace ckw::app
{
namespace
{

void print_section(std::ostream &out, std::string_view title, const std::vector<upload::ArtifactOutcome> &outcomes,
                   bool with_reason)
{
    out << title << " (" << outcomes.size() << ")\n";
    for (const auto &outcome : outcomes)
    {
        out << "  " << outcome.name;
        if (!outcome.format.empty())
        {
            out << " [" << outcome.format << "]";
        }
        if (with_reason && outcome.state.error)
        {
            out << ": " << to_string(outcome.state.error->kind) << ": " << outcome.state.error->message;
        }
        out << '\n';
    }
}

} // namespace

void print_summary(const upload::RunSummary &summary, std::ostream &out)
{
    print_section(out, "completed", summary.completed, false);
    print_section(out, "failed", summary.failed, true);
    print_section(out, "timed out", summary.timed_out, true);
    if (!summary.pending.empty())
    {
        print_section(out, "pending (server still processing)", summary.pending, false);
    }

    const auto &counters = summary.counters;
    out << "artifacts found: " << counters.artifacts_found << ", duplicates collapsed: "
        << counters.duplicates_collapsed << ", skipped: " << counters.diagnostics << '\n';
    out << "unique chunks: " << counters.unique_chunks << ", already on server: "
        << counters.chunks_already_on_server << '\n';
    out << "batches sent: " << counters.batches_sent << ", failed: " << counters.batches_failed
        << ", bytes sent: " << counters.bytes_sent
        << ", retries: " << counters.retries << '\n';
}

auto exit_code(const std::expected<upload::RunSummary, Error> &outcome, bool timeouts_are_failures) -> int
{
    if (!outcome)
    {
        return outcome.error().kind == ErrorKind::Cancelled ? kExitCancelled : kExitRunError;
    }
    if (outcome->was_cancelled())
    {
        return kExitCancelled;
    }
    return outcome->has_failures(timeouts_are_failures) ? kExitFailures : kExitSuccess;
}

} // namespace ckw::app
