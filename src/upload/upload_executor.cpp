/**
 * @file upload_executor.cpp
 * @brief batch verification, compression, retrying send and registry updates
 */
#include "ckw/upload/upload_executor.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

#include "ckw/chunk/chunker.hpp"
#include "ckw/common/log.hpp"
#include "ckw/common/worker_pool.hpp"
#include "ckw/net/compression.hpp"

namespace ckw::upload
{
namespace
{

constexpr std::string_view kComponent = "upload";

} // namespace

UploadExecutor::UploadExecutor(net::ChunkServer &server, const chunk::ChunkStore &store, ChunkRegistry &registry,
                               RetryPolicy retry, Timing timing, std::stop_token stop, ExecutorOptions options,
                               Repairer repair)
    : server_{server},
      store_{store},
      registry_{registry},
      retry_{std::move(retry)},
      timing_{std::move(timing)},
      stop_{std::move(stop)},
      options_{options},
      repair_{std::move(repair)}
{
}

auto UploadExecutor::verified_bytes(const PlannedChunk &planned) -> std::expected<std::vector<std::byte>, Error>
{
    const auto hex   = planned.checksum.hex();
    auto       chunk = store_.find(planned.checksum);
    if (!chunk)
    {
        return std::unexpected(make_error(ErrorKind::ProtocolError, "chunk is not in the store", {hex}));
    }
    if (chunk::verify(*chunk))
    {
        const auto bytes = chunk->bytes();
        return std::vector<std::byte>(bytes.begin(), bytes.end());
    }

    log::warn(kComponent, std::format("chunk {} no longer matches its checksum, re-reading source", hex));
    if (!repair_)
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "chunk content changed", {hex}));
    }
    if (auto repaired = repair_(planned.checksum); !repaired)
    {
        return std::unexpected(Error{ErrorKind::ChecksumMismatch, repaired.error().message, repaired.error().context});
    }

    chunk = store_.find(planned.checksum);
    if (!chunk || !chunk::verify(*chunk))
    {
        return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "chunk content changed", {hex}));
    }
    const auto bytes = chunk->bytes();
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

auto UploadExecutor::upload(const UploadBatch &batch) -> BatchOutcome
{
    BatchOutcome outcome{batch.index, 0U, std::nullopt};
    const auto   crumb = std::format("batch {}", batch.index);
    if (stop_.stop_requested())
    {
        outcome.error = make_error(ErrorKind::Cancelled, "run cancelled before upload", {crumb});
        return outcome;
    }

    net::BatchPayload     payload{};
    payload.compression = options_.compression;
    std::vector<Checksum> sent;
    std::uint64_t         logical_bytes = 0U;
    std::uint64_t         wire_bytes    = 0U;
    std::optional<Error>  chunk_failure;

    for (const auto &planned : batch.chunks)
    {
        const std::span<const Checksum> single{&planned.checksum, 1U};
        auto                            bytes = verified_bytes(planned);
        if (!bytes)
        {
            log::error(kComponent, describe(bytes.error()));
            registry_.mark_failed(single, bytes.error());
            chunk_failure = chunk_failure.value_or(bytes.error());
            continue;
        }
        logical_bytes += bytes->size();

        if (options_.compression == net::Compression::Gzip)
        {
            auto packed = net::gzip_compress(*bytes);
            if (!packed)
            {
                auto error = with_context(packed.error(), planned.checksum.hex());
                registry_.mark_failed(single, error);
                chunk_failure = chunk_failure.value_or(error);
                continue;
            }
            bytes = std::move(*packed);
        }
        wire_bytes += bytes->size();
        sent.push_back(planned.checksum);
        payload.parts.emplace_back(planned.checksum, std::move(*bytes));
    }

    if (payload.parts.empty())
    {
        ++batches_failed_;
        outcome.error = chunk_failure;
        return outcome;
    }

    std::uint32_t attempts = 0U;
    auto          result   = run_with_retry(
        retry_, timing_, stop_, crumb, [&] { return server_.upload_batch(payload); }, &attempts);
    outcome.attempts = attempts;
    if (attempts > 1U)
    {
        retries_ += attempts - 1U;
    }

    if (!result)
    {
        auto error = with_context(result.error().error, crumb);
        if (error.kind != ErrorKind::Cancelled)
        {
            log::error(kComponent, describe(error));
            registry_.mark_failed(sent, error);
        }
        ++batches_failed_;
        outcome.error = std::move(error);
        return outcome;
    }

    registry_.mark_uploaded(sent);
    ++batches_sent_;
    chunks_sent_ += sent.size();
    bytes_sent_ += logical_bytes;
    wire_bytes_ += wire_bytes;
    log::debug(kComponent,
               std::format("{} landed: {} chunk(s), {} bytes on the wire", crumb, sent.size(), wire_bytes));
    outcome.error = chunk_failure;
    return outcome;
}

auto UploadExecutor::upload_all(const std::vector<UploadBatch> &batches) -> std::vector<BatchOutcome>
{
    std::vector<BatchOutcome> outcomes(batches.size());
    if (batches.empty())
    {
        return outcomes;
    }

    WorkerPool pool{std::max<std::size_t>(1U, std::min(options_.concurrency, batches.size()))};
    for (std::size_t i = 0; i < batches.size(); ++i)
    {
        pool.submit([this, &batches, &outcomes, i] { outcomes[i] = upload(batches[i]); });
    }
    pool.wait_idle();

    const auto failed = std::count_if(outcomes.begin(), outcomes.end(),
                                      [](const BatchOutcome &outcome) { return outcome.error.has_value(); });
    log::info(kComponent, std::format("{}/{} batch(es) uploaded cleanly",
                                      batches.size() - static_cast<std::size_t>(failed), batches.size()));
    return outcomes;
}

auto UploadExecutor::stats() const noexcept -> UploadStats
{
    return UploadStats{batches_sent_.load(), batches_failed_.load(), chunks_sent_.load(),
                       bytes_sent_.load(),   wire_bytes_.load(),     retries_.load()};
}

} // namespace ckw::upload
