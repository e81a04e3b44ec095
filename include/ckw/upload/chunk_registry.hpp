/**
 * @file chunk_registry.hpp
 * @brief per-chunk bookkeeping: Missing -> Uploaded, or Missing -> Failed
 *
 * the registry is the assembly barrier's source of truth. an artifact may
 * only be submitted for assembly once every chunk it references is Uploaded
 * (already on the server counts). a server that later reports a chunk as
 * missing is re-sent through claim()/release(), so artifacts sharing that
 * chunk trigger one send per round instead of one each.
 *
 * thread safety: every member locks the same mutex. claim() may block on
 * sends owned by other callers.
 */
#pragma once

#include <cstddef>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/common/error.hpp"

namespace ckw::upload
{

enum class ChunkStatus : std::uint8_t
{
    Missing,
    Uploaded,
    Failed
};

/**
 * @brief barrier verdict for one artifact's chunk list
 */
struct BarrierCheck
{
    std::vector<Checksum> missing;  ///< chunks not yet on the server
    std::optional<Error>  failure;  ///< first permanent chunk failure, if any
};

class ChunkRegistry
{
public:
    /**
     * @brief records chunks as known to the server (oracle hits)
     */
    void mark_uploaded(std::span<const Checksum> checksums);

    void mark_failed(std::span<const Checksum> checksums, const Error &reason);

    /**
     * @brief claims chunks for a send at `round`, waiting out sends already in flight
     *
     * round 0 is the first delivery: only chunks still Missing are claimed.
     * round n > 0 is the n-th re-upload after the server lost a chunk: a
     * chunk is claimed unless it Failed or was already re-sent at round n or
     * later. the wait covers every chunk in the span before anything is
     * claimed, so no caller ever holds a claim while it waits.
     *
     * @return the chunks the caller now owns and must hand back via release()
     */
    [[nodiscard]] auto claim(std::span<const Checksum> chunks, std::uint32_t round) -> std::vector<Checksum>;

    /**
     * @brief ends a claim, records the round it served and wakes waiters
     */
    void release(std::span<const Checksum> chunks, std::uint32_t round);

    [[nodiscard]] auto status(const Checksum &checksum) const -> ChunkStatus;

    [[nodiscard]] auto failure(const Checksum &checksum) const -> std::optional<Error>;

    /**
     * @brief checks the assembly barrier for an ordered chunk list
     */
    [[nodiscard]] auto check(std::span<const Checksum> chunks) const -> BarrierCheck;

    [[nodiscard]] auto count(ChunkStatus status) const -> std::size_t;

private:
    struct Entry
    {
        ChunkStatus          status{ChunkStatus::Missing};
        std::optional<Error> failure;
        std::uint32_t        resent_round{0U};
        bool                 in_flight{false};
    };

    mutable std::mutex                  mutex_{};
    std::condition_variable             released_{};
    std::unordered_map<Checksum, Entry> entries_{};
};

} // namespace ckw::upload
