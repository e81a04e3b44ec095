/**
 * @file chunk_store.hpp
 * @brief run-global, content-addressed chunk registry (checksum -> bytes view)
 *
 * every chunk the run knows about lives here exactly once, however many
 * artifacts contain it. a chunk is a view (offset + length) into its parent
 * artifact's shared buffer, so interning costs no copy and the buffer stays
 * alive as long as any chunk points into it.
 *
 * ownership is recorded too: when a chunk fails permanently, every artifact
 * that contains it is looked up here and marked failed.
 *
 * thread safety: all members lock an internal mutex, chunking workers intern
 * concurrently and uploaders read concurrently.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "ckw/collect/artifact.hpp"
#include "ckw/common/checksum.hpp"

namespace ckw::chunk
{

/**
 * @brief one content-addressed slice of an artifact
 */
struct Chunk
{
    Checksum                                      checksum{};
    std::shared_ptr<const std::vector<std::byte>> buffer;
    std::size_t                                   offset{0U};
    std::size_t                                   length{0U};

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::byte>
    {
        if (!buffer)
        {
            return {};
        }
        return std::span<const std::byte>{*buffer}.subspan(offset, length);
    }
};

class ChunkStore
{
public:
    /**
     * @brief registers a chunk for an owning artifact
     *
     * @return true when the checksum was new to the store
     */
    auto intern(Chunk chunk, ArtifactId owner) -> bool;

    [[nodiscard]] auto find(const Checksum &checksum) const -> std::optional<Chunk>;

    /**
     * @brief artifacts containing the chunk, ascending ids, no repeats
     */
    [[nodiscard]] auto owners(const Checksum &checksum) const -> std::vector<ArtifactId>;

    /**
     * @brief swaps the backing view after a successful re-read
     */
    void rebind(const Checksum &checksum, std::shared_ptr<const std::vector<std::byte>> buffer, std::size_t offset);

    [[nodiscard]] auto size() const -> std::size_t;

    /**
     * @brief sum of distinct chunk lengths
     */
    [[nodiscard]] auto total_bytes() const -> std::uint64_t;

private:
    struct Entry
    {
        Chunk                   chunk;
        std::vector<ArtifactId> owners;
    };

    mutable std::mutex                     mutex_{};
    std::unordered_map<Checksum, Entry>    chunks_{};
};

} // namespace ckw::chunk
