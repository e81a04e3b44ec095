/**
 * @file batch_planner.cpp
 * @brief first-fit decreasing packing of chunks into upload requests
 *
 * side-effect free so the invariants can be hammered from unit tests with
 * arbitrary inputs.
 */
#include "ckw/upload/batch_planner.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace ckw::upload
{

auto plan_batches(std::vector<PlannedChunk> chunks, const BatchLimits &limits) -> std::expected<BatchPlan, Error>
{
    if (limits.max_request_bytes == 0U || limits.max_chunk_count == 0U || limits.max_chunk_size == 0U)
    {
        return std::unexpected(make_error(ErrorKind::ConfigInvalid, "batch limits must be positive",
                                          {std::format("max_request_bytes={}", limits.max_request_bytes),
                                           std::format("max_chunk_count={}", limits.max_chunk_count),
                                           std::format("max_chunk_size={}", limits.max_chunk_size)}));
    }

    // largest first, checksum order breaks ties and makes duplicates adjacent
    std::sort(chunks.begin(), chunks.end(),
              [](const PlannedChunk &lhs, const PlannedChunk &rhs)
              {
                  if (lhs.length != rhs.length)
                  {
                      return lhs.length > rhs.length;
                  }
                  return lhs.checksum < rhs.checksum;
              });
    chunks.erase(std::unique(chunks.begin(), chunks.end(),
                             [](const PlannedChunk &lhs, const PlannedChunk &rhs)
                             { return lhs.checksum == rhs.checksum; }),
                 chunks.end());

    BatchPlan plan{};
    for (const auto &chunk : chunks)
    {
        if (chunk.length > limits.max_chunk_size || chunk.length > limits.max_request_bytes)
        {
            plan.rejected.push_back(chunk);
            continue;
        }

        const auto fits = std::find_if(plan.batches.begin(), plan.batches.end(),
                                       [&](const UploadBatch &batch)
                                       {
                                           return batch.chunks.size() < limits.max_chunk_count &&
                                                  batch.total_bytes + chunk.length <= limits.max_request_bytes;
                                       });
        if (fits == plan.batches.end())
        {
            UploadBatch batch{};
            batch.index       = plan.batches.size();
            batch.total_bytes = chunk.length;
            batch.chunks.push_back(chunk);
            plan.batches.push_back(std::move(batch));
            continue;
        }
        fits->chunks.push_back(chunk);
        fits->total_bytes += chunk.length;
    }
    return plan;
}

} // namespace ckw::upload
