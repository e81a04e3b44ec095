/**
 * @file upload_executor.hpp
 * @brief sends planned batches with bounded concurrency, verification and retry
 *
 * per batch:
 * 1. every chunk is re-digested; a mismatch triggers one repair (re-read of
 *    the owning artifact) and a chunk that still disagrees is marked Failed
 *    with ChecksumMismatch and left out of the request
 * 2. the remaining parts are gzip'd when negotiated
 * 3. the request runs under the RetryPolicy
 * 4. the ChunkRegistry learns the outcome (Uploaded or Failed); a batch that
 *    was cancelled leaves its chunks Missing
 *
 * at most `concurrency` batches are in flight at once (the WorkerPool size).
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

#include "ckw/chunk/chunk_store.hpp"
#include "ckw/common/error.hpp"
#include "ckw/common/timing.hpp"
#include "ckw/net/chunk_server.hpp"
#include "ckw/upload/batch_planner.hpp"
#include "ckw/upload/chunk_registry.hpp"
#include "ckw/upload/retry_policy.hpp"

namespace ckw::upload
{

struct ExecutorOptions
{
    net::Compression compression{net::Compression::Uncompressed};
    std::size_t      concurrency{1U};
};

struct BatchOutcome
{
    std::size_t          index{0U};
    std::uint32_t        attempts{0U};
    std::optional<Error> error;  ///< nullopt when the batch landed
};

/**
 * @brief snapshot of the executor's counters
 */
struct UploadStats
{
    std::size_t   batches_sent{0U};   ///< successful requests
    std::size_t   batches_failed{0U};
    std::size_t   chunks_sent{0U};
    std::uint64_t bytes_sent{0U};     ///< uncompressed chunk bytes
    std::uint64_t wire_bytes{0U};     ///< bytes after compression
    std::size_t   retries{0U};        ///< attempts beyond the first, summed
};

class UploadExecutor
{
public:
    /// re-reads the owner of a corrupted chunk and rebinds it in the store
    using Repairer = std::function<std::expected<void, Error>(const Checksum &)>;

    UploadExecutor(net::ChunkServer &server, const chunk::ChunkStore &store, ChunkRegistry &registry,
                   RetryPolicy retry, Timing timing, std::stop_token stop, ExecutorOptions options,
                   Repairer repair = {});

    /**
     * @brief sends one batch synchronously on the calling thread
     */
    [[nodiscard]] auto upload(const UploadBatch &batch) -> BatchOutcome;

    /**
     * @brief sends every batch through a pool of `concurrency` workers
     *
     * @return outcomes ordered by batch index
     */
    [[nodiscard]] auto upload_all(const std::vector<UploadBatch> &batches) -> std::vector<BatchOutcome>;

    [[nodiscard]] auto stats() const noexcept -> UploadStats;

private:
    [[nodiscard]] auto verified_bytes(const PlannedChunk &planned) -> std::expected<std::vector<std::byte>, Error>;

    net::ChunkServer        &server_;
    const chunk::ChunkStore &store_;
    ChunkRegistry           &registry_;
    RetryPolicy              retry_;
    Timing                   timing_;
    std::stop_token          stop_;
    ExecutorOptions          options_;
    Repairer                 repair_;

    std::atomic<std::size_t>   batches_sent_{0U};
    std::atomic<std::size_t>   batches_failed_{0U};
    std::atomic<std::size_t>   chunks_sent_{0U};
    std::atomic<std::uint64_t> bytes_sent_{0U};
    std::atomic<std::uint64_t> wire_bytes_{0U};
    std::atomic<std::size_t>   retries_{0U};
};

} // namespace ckw::upload
