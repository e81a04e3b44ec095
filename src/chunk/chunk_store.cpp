/**
 * @file chunk_store.cpp
 * @brief mutex-guarded content-addressed chunk map
 */
#include "ckw/chunk/chunk_store.hpp"

#include <algorithm>
#include <utility>

namespace ckw::chunk
{

auto ChunkStore::intern(Chunk chunk, ArtifactId owner) -> bool
{
    const std::lock_guard lock{mutex_};
    auto [it, inserted] = chunks_.try_emplace(chunk.checksum, Entry{std::move(chunk), {}});
    auto &owners        = it->second.owners;
    const auto position = std::lower_bound(owners.begin(), owners.end(), owner);
    if (position == owners.end() || *position != owner)
    {
        owners.insert(position, owner);
    }
    return inserted;
}

auto ChunkStore::find(const Checksum &checksum) const -> std::optional<Chunk>
{
    const std::lock_guard lock{mutex_};
    const auto            found = chunks_.find(checksum);
    if (found == chunks_.end())
    {
        return std::nullopt;
    }
    return found->second.chunk;
}

auto ChunkStore::owners(const Checksum &checksum) const -> std::vector<ArtifactId>
{
    const std::lock_guard lock{mutex_};
    const auto            found = chunks_.find(checksum);
    if (found == chunks_.end())
    {
        return {};
    }
    return found->second.owners;
}

void ChunkStore::rebind(const Checksum &checksum, std::shared_ptr<const std::vector<std::byte>> buffer,
                        std::size_t offset)
{
    const std::lock_guard lock{mutex_};
    const auto            found = chunks_.find(checksum);
    if (found == chunks_.end())
    {
        return;
    }
    found->second.chunk.buffer = std::move(buffer);
    found->second.chunk.offset = offset;
}

auto ChunkStore::size() const -> std::size_t
{
    const std::lock_guard lock{mutex_};
    return chunks_.size();
}

auto ChunkStore::total_bytes() const -> std::uint64_t
{
    const std::lock_guard lock{mutex_};
    std::uint64_t         total = 0U;
    for (const auto &[checksum, entry] : chunks_)
    {
        total += entry.chunk.length;
    }
    return total;
}

} // namespace ckw::chunk
