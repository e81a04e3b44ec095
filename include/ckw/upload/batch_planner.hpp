/**
 * @file batch_planner.hpp
 * @brief bin-packs missing chunks into request-sized batches (pure af)
 *
 * first-fit decreasing: chunks are sorted by length (largest first, checksum
 * breaking ties, so the plan is deterministic for a given input set) and each
 * lands in the first batch with room for both its bytes and one more part.
 * no batch ever exceeds max_request_bytes or max_chunk_count.
 *
 * chunks that can never fit (longer than max_chunk_size or than a whole
 * request) are returned separately instead of being dropped, the pipeline
 * turns them into ArtifactTooLarge for their owners.
 *
 * example:
 * @code
 * auto plan = ckw::upload::plan_batches(missing, {32U << 20U, 64U, 8U << 20U});
 * if (!plan) {
 *     log::error("plan", describe(plan.error()));
 * }
 * // plan->batches is ready for the executor uwu
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/common/error.hpp"
#include "ckw/net/capabilities.hpp"

namespace ckw::upload
{

struct PlannedChunk
{
    Checksum      checksum{};
    std::uint64_t length{0U};
};

struct UploadBatch
{
    std::size_t               index{0U};        ///< position in the plan
    std::vector<PlannedChunk> chunks;           ///< distinct chunks, packing order
    std::uint64_t             total_bytes{0U};  ///< sum of chunk lengths
    std::uint32_t             attempts{0U};     ///< filled in by the executor
};

struct BatchLimits
{
    std::uint64_t max_request_bytes{0U};
    std::uint64_t max_chunk_count{0U};
    std::uint64_t max_chunk_size{0U};

    [[nodiscard]] static auto from(const net::ServerCapabilities &caps) noexcept -> BatchLimits
    {
        return BatchLimits{caps.max_request_bytes, caps.max_chunk_count, caps.max_chunk_size};
    }
};

struct BatchPlan
{
    std::vector<UploadBatch>  batches;
    std::vector<PlannedChunk> rejected; ///< chunks no batch can carry
};

/**
 * @brief packs distinct chunks into batches under the request limits
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] chunks missing chunks (duplicates by checksum are collapsed)
 * @param[in] limits server request limits, all strictly positive
 * @return the plan, or ConfigInvalid when a limit is zero
 *
 * @post every batch satisfies total_bytes <= max_request_bytes and
 *       chunks.size() <= max_chunk_count
 * @post every input chunk appears in exactly one batch or in rejected
 *
 * @complexity O(n log n + n * b) for n chunks and b batches
 */
[[nodiscard]] auto plan_batches(std::vector<PlannedChunk> chunks, const BatchLimits &limits)
    -> std::expected<BatchPlan, Error>;

} // namespace ckw::upload
