/**
 * @file chunker.cpp
 * @brief fixed-size chunking, parallel hashing and single re-read repair
 */
#include "ckw/chunk/chunker.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "ckw/common/log.hpp"
#include "ckw/common/worker_pool.hpp"

namespace ckw::chunk
{
namespace
{

constexpr std::string_view kComponent = "chunk";

} // namespace

auto chunk_artifact(Artifact &artifact, const ChunkLimits &limits, ChunkStore &store) -> std::expected<void, Error>
{
    if (limits.chunk_size == 0U || limits.max_chunks == 0U)
    {
        return std::unexpected(make_error(ErrorKind::ConfigInvalid, "chunk limits must be positive", {artifact.name}));
    }
    if (!artifact.bytes)
    {
        return std::unexpected(make_error(ErrorKind::IoError, "artifact has no loaded content", {artifact.name}));
    }

    const auto &content = *artifact.bytes;
    const auto  size    = static_cast<std::uint64_t>(content.size());
    const auto  count   = required_chunks(size, limits.chunk_size);
    if (size > limits.file_cap())
    {
        return std::unexpected(make_error(ErrorKind::ArtifactTooLarge,
                                          std::format("{} bytes needs {} chunks, server cap is {} bytes", size,
                                                      count, limits.file_cap()),
                                          {artifact.name}));
    }

    std::vector<Checksum> chunks;
    chunks.reserve(static_cast<std::size_t>(count));
    const std::span<const std::byte> all{content};

    if (count == 1U)
    {
        // single chunk: chunk identity and artifact identity coincide
        const auto sum = digest(all);
        chunks.push_back(sum);
        store.intern(Chunk{sum, artifact.bytes, 0U, content.size()}, artifact.id);
        artifact.checksum = sum;
    }
    else
    {
        ChecksumAccumulator whole;
        for (std::uint64_t index = 0; index < count; ++index)
        {
            const auto offset = static_cast<std::size_t>(index * limits.chunk_size);
            const auto length = std::min<std::size_t>(static_cast<std::size_t>(limits.chunk_size), content.size() - offset);
            const auto piece  = all.subspan(offset, length);
            whole.update(piece);
            const auto sum = digest(piece);
            chunks.push_back(sum);
            store.intern(Chunk{sum, artifact.bytes, offset, length}, artifact.id);
        }
        artifact.checksum = whole.finish();
    }

    artifact.chunks = std::move(chunks);
    artifact.stage  = ArtifactStage::Chunked;
    return {};
}

auto chunk_artifacts(std::vector<Artifact> &artifacts, const ChunkLimits &limits, ChunkStore &store,
                     std::size_t workers) -> std::vector<ChunkingFailure>
{
    std::vector<ChunkingFailure> failures;
    std::mutex                   failures_mutex;
    {
        WorkerPool pool{std::max<std::size_t>(1U, std::min(workers, artifacts.size()))};
        for (auto &artifact : artifacts)
        {
            pool.submit(
                [&]()
                {
                    auto chunked = chunk_artifact(artifact, limits, store);
                    if (!chunked)
                    {
                        log::warn(kComponent, describe(chunked.error()));
                        const std::lock_guard lock{failures_mutex};
                        failures.push_back(ChunkingFailure{artifact.id, chunked.error()});
                    }
                });
        }
        pool.wait_idle();
    }

    std::sort(failures.begin(), failures.end(),
              [](const ChunkingFailure &lhs, const ChunkingFailure &rhs) { return lhs.id < rhs.id; });
    log::info(kComponent, std::format("{} artifact(s) chunked into {} unique chunk(s)",
                                      artifacts.size() - failures.size(), store.size()));
    return failures;
}

auto verify(const Chunk &chunk) -> bool
{
    return digest(chunk.bytes()) == chunk.checksum;
}

auto repair(const Checksum &checksum, const Artifact &owner, const ChunkLimits &limits, ChunkStore &store)
    -> std::expected<void, Error>
{
    const auto position = std::find(owner.chunks.begin(), owner.chunks.end(), checksum);
    if (position == owner.chunks.end())
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "chunk does not belong to artifact",
                                          {owner.name, checksum.hex()}));
    }
    if (!owner.reload)
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "content changed and cannot be re-read",
                                          {owner.name, checksum.hex()}));
    }

    auto fresh = owner.reload();
    if (!fresh)
    {
        return std::unexpected(with_context(fresh.error(), owner.name));
    }

    const auto index  = static_cast<std::uint64_t>(std::distance(owner.chunks.begin(), position));
    const auto offset = index * limits.chunk_size;
    if (offset > fresh->size())
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "content shrank since it was chunked",
                                          {owner.name, checksum.hex()}));
    }
    const auto length = std::min<std::uint64_t>(limits.chunk_size, fresh->size() - offset);
    auto       buffer = std::make_shared<const std::vector<std::byte>>(std::move(*fresh));
    const auto piece  = std::span<const std::byte>{*buffer}.subspan(static_cast<std::size_t>(offset),
                                                                    static_cast<std::size_t>(length));
    if (digest(piece) != checksum)
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "content changed since it was chunked",
                                          {owner.name, checksum.hex()}));
    }

    log::info(kComponent, std::format("re-read {} to recover chunk {}", owner.name, checksum.hex()));
    store.rebind(checksum, std::move(buffer), static_cast<std::size_t>(offset));
    return {};
}

} // namespace ckw::chunk
