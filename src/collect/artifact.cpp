/**
 * @file artifact.cpp
 * @brief assembly state helpers
 */
#include "ckw/collect/artifact.hpp"

#include <utility>

namespace ckw
{

auto to_string(AssemblyPhase phase) noexcept -> std::string_view
{
    switch (phase)
    {
    case AssemblyPhase::Requested:
        return "requested";
    case AssemblyPhase::InProgress:
        return "in_progress";
    case AssemblyPhase::MissingChunks:
        return "missing_chunks";
    case AssemblyPhase::Complete:
        return "complete";
    case AssemblyPhase::Pending:
        return "pending";
    case AssemblyPhase::Error:
        return "error";
    }
    return "unknown";
}

auto AssemblyState::requested() -> AssemblyState
{
    return AssemblyState{AssemblyPhase::Requested, {}, std::nullopt};
}

auto AssemblyState::in_progress() -> AssemblyState
{
    return AssemblyState{AssemblyPhase::InProgress, {}, std::nullopt};
}

auto AssemblyState::missing_chunks(std::vector<Checksum> checksums) -> AssemblyState
{
    return AssemblyState{AssemblyPhase::MissingChunks, std::move(checksums), std::nullopt};
}

auto AssemblyState::complete() -> AssemblyState
{
    return AssemblyState{AssemblyPhase::Complete, {}, std::nullopt};
}

auto AssemblyState::pending() -> AssemblyState
{
    return AssemblyState{AssemblyPhase::Pending, {}, std::nullopt};
}

auto AssemblyState::failed(Error reason) -> AssemblyState
{
    return AssemblyState{AssemblyPhase::Error, {}, std::move(reason)};
}

auto transition(AssemblyState &current, AssemblyState next) -> bool
{
    if (current.is_terminal())
    {
        return false;
    }
    if (next.phase == AssemblyPhase::Requested && current.phase != AssemblyPhase::MissingChunks &&
        current.phase != AssemblyPhase::Requested)
    {
        // only a re-upload round may send us back to square one
        return false;
    }
    current = std::move(next);
    return true;
}

} // namespace ckw
