/**
 * @file chunker.hpp
 * @brief splits artifacts into fixed-size, content-addressed chunks
 *
 * the chunk boundary is a pure function of (content, chunk size): the final
 * chunk may be short, an artifact no larger than one chunk yields exactly one
 * chunk whose checksum equals the artifact checksum. empty artifacts yield a
 * single zero-length chunk.
 *
 * hashing is CPU-bound and independent per artifact, chunk_artifacts() fans
 * out over a WorkerPool and interns into the shared ChunkStore.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <vector>

#include "ckw/chunk/chunk_store.hpp"
#include "ckw/collect/artifact.hpp"
#include "ckw/common/error.hpp"

namespace ckw::chunk
{

/**
 * @brief chunking-relevant slice of the server capabilities
 */
struct ChunkLimits
{
    std::uint64_t chunk_size{0U};    ///< maxChunkSize
    std::uint64_t max_chunks{0U};    ///< maxChunkCount
    std::uint64_t max_file_size{0U}; ///< server file cap, 0 when unset

    /**
     * @brief largest artifact the server accepts
     *
     * chunk_size * max_chunks saturates at the uint64 ceiling instead of wrapping
     */
    [[nodiscard]] constexpr auto file_cap() const noexcept -> std::uint64_t
    {
        if (max_file_size != 0U)
        {
            return max_file_size;
        }
        if (chunk_size != 0U && max_chunks > std::numeric_limits<std::uint64_t>::max() / chunk_size)
        {
            return std::numeric_limits<std::uint64_t>::max();
        }
        return chunk_size * max_chunks;
    }
};

/**
 * @brief chunk count for `size` bytes (never zero)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto required_chunks(std::uint64_t size, std::uint64_t chunk_size) noexcept -> std::uint64_t
{
    if (size == 0U || chunk_size == 0U)
    {
        return 1U;
    }
    return (size + chunk_size - 1U) / chunk_size;
}

/**
 * @brief chunks one artifact, filling `checksum` and `chunks` and interning
 *
 * @return ArtifactTooLarge when the artifact exceeds the file cap, ConfigInvalid
 *         when the limits are unusable
 */
[[nodiscard]] auto chunk_artifact(Artifact &artifact, const ChunkLimits &limits, ChunkStore &store)
    -> std::expected<void, Error>;

struct ChunkingFailure
{
    ArtifactId id{0U};
    Error      error;
};

/**
 * @brief chunks every artifact in parallel, returning the per-artifact failures
 *
 * failures are isolated: the failing artifact keeps no chunks and the others
 * are unaffected. the result is sorted by artifact id.
 */
[[nodiscard]] auto chunk_artifacts(std::vector<Artifact> &artifacts, const ChunkLimits &limits, ChunkStore &store,
                                   std::size_t workers) -> std::vector<ChunkingFailure>;

/**
 * @brief true when the chunk's current bytes still hash to its checksum
 */
[[nodiscard]] auto verify(const Chunk &chunk) -> bool;

/**
 * @brief re-reads the owning artifact and rebinds the chunk to fresh bytes
 *
 * ⚠️ IMPURE FUNCTION (file system, mutates the store)
 *
 * @return ChecksumMismatch when the re-read bytes still disagree
 */
[[nodiscard]] auto repair(const Checksum &checksum, const Artifact &owner, const ChunkLimits &limits,
                          ChunkStore &store) -> std::expected<void, Error>;

} // namespace ckw::chunk
