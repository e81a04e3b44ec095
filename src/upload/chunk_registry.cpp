/**
 * @file chunk_registry.cpp
 * @brief mutex-guarded chunk status table
 */
#include "ckw/upload/chunk_registry.hpp"

#include <algorithm>

namespace ckw::upload
{

void ChunkRegistry::mark_uploaded(std::span<const Checksum> checksums)
{
    const std::lock_guard lock{mutex_};
    for (const auto &checksum : checksums)
    {
        auto &entry   = entries_[checksum];
        entry.status  = ChunkStatus::Uploaded;
        entry.failure = std::nullopt;
    }
}

void ChunkRegistry::mark_failed(std::span<const Checksum> checksums, const Error &reason)
{
    const std::lock_guard lock{mutex_};
    for (const auto &checksum : checksums)
    {
        auto &entry   = entries_[checksum];
        entry.status  = ChunkStatus::Failed;
        entry.failure = reason;
    }
}

auto ChunkRegistry::claim(std::span<const Checksum> chunks, std::uint32_t round) -> std::vector<Checksum>
{
    std::unique_lock lock{mutex_};
    released_.wait(lock,
                   [&]
                   {
                       return std::none_of(chunks.begin(), chunks.end(),
                                           [&](const Checksum &checksum)
                                           {
                                               const auto found = entries_.find(checksum);
                                               return found != entries_.end() && found->second.in_flight;
                                           });
                   });

    std::vector<Checksum> claimed;
    for (const auto &checksum : chunks)
    {
        auto &entry = entries_[checksum];
        if (entry.in_flight)
        {
            continue; // listed twice
        }
        const bool due = round == 0U ? entry.status == ChunkStatus::Missing
                                     : entry.status != ChunkStatus::Failed && entry.resent_round < round;
        if (due)
        {
            entry.in_flight = true;
            claimed.push_back(checksum);
        }
    }
    return claimed;
}

void ChunkRegistry::release(std::span<const Checksum> chunks, std::uint32_t round)
{
    {
        const std::lock_guard lock{mutex_};
        for (const auto &checksum : chunks)
        {
            auto &entry        = entries_[checksum];
            entry.in_flight    = false;
            entry.resent_round = std::max(entry.resent_round, round);
        }
    }
    released_.notify_all();
}

auto ChunkRegistry::status(const Checksum &checksum) const -> ChunkStatus
{
    const std::lock_guard lock{mutex_};
    const auto            found = entries_.find(checksum);
    return found == entries_.end() ? ChunkStatus::Missing : found->second.status;
}

auto ChunkRegistry::failure(const Checksum &checksum) const -> std::optional<Error>
{
    const std::lock_guard lock{mutex_};
    const auto            found = entries_.find(checksum);
    if (found == entries_.end())
    {
        return std::nullopt;
    }
    return found->second.failure;
}

auto ChunkRegistry::check(std::span<const Checksum> chunks) const -> BarrierCheck
{
    BarrierCheck          verdict;
    const std::lock_guard lock{mutex_};
    for (const auto &checksum : chunks)
    {
        const auto found = entries_.find(checksum);
        if (found == entries_.end() || found->second.status == ChunkStatus::Missing)
        {
            if (std::find(verdict.missing.begin(), verdict.missing.end(), checksum) == verdict.missing.end())
            {
                verdict.missing.push_back(checksum);
            }
            continue;
        }
        if (found->second.status == ChunkStatus::Failed && !verdict.failure)
        {
            verdict.failure = found->second.failure;
        }
    }
    return verdict;
}

auto ChunkRegistry::count(ChunkStatus status) const -> std::size_t
{
    const std::lock_guard lock{mutex_};
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [&](const auto &item) { return item.second.status == status; }));
}

} // namespace ckw::upload
