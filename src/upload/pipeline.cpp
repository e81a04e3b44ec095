/**
 * @file pipeline.cpp
 * @brief wires collector, chunker, oracle, planner, executor and coordinator together
 */
#include "ckw/upload/pipeline.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <span>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ckw/chunk/chunk_store.hpp"
#include "ckw/chunk/chunker.hpp"
#include "ckw/collect/collector.hpp"
#include "ckw/common/log.hpp"
#include "ckw/common/worker_pool.hpp"
#include "ckw/net/capabilities.hpp"
#include "ckw/upload/assembly_coordinator.hpp"
#include "ckw/upload/batch_planner.hpp"
#include "ckw/upload/chunk_registry.hpp"
#include "ckw/upload/upload_executor.hpp"

namespace ckw::upload
{
namespace
{

constexpr std::string_view kComponent = "pipeline";

/**
 * @brief capability fetch with retry, mapped onto the run-level taxonomy
 *
 * auth and cancellation keep their kind, everything else becomes
 * CapabilityFetchError.
 */
[[nodiscard]] auto fetch_capabilities(net::ChunkServer &server, const RetryPolicy &retry, const Timing &timing,
                                      std::stop_token stop) -> std::expected<net::ServerCapabilities, Error>
{
    auto caps = run_with_retry(retry, timing, stop, "capabilities", [&] { return server.fetch_capabilities(); });
    if (!caps)
    {
        auto error = caps.error().error;
        if (error.kind != ErrorKind::AuthError && error.kind != ErrorKind::Cancelled)
        {
            error = Error{ErrorKind::CapabilityFetchError,
                          std::format("could not fetch server capabilities: {}", error.message),
                          std::move(error.context)};
        }
        return std::unexpected(std::move(error));
    }
    if (auto valid = net::validate(*caps); !valid)
    {
        return std::unexpected(valid.error());
    }
    return std::move(*caps);
}

[[nodiscard]] auto make_request(const Artifact &artifact) -> net::AssembleRequest
{
    net::AssembleRequest request{artifact.checksum, artifact.chunks, artifact.name, std::nullopt};
    if (!artifact.format.identifiers.empty())
    {
        request.debug_id = artifact.format.identifiers.front();
    }
    return request;
}

/**
 * @brief bookkeeping shared by the stages of one run
 */
class Run
{
public:
    Run(std::vector<Artifact> &artifacts, UploadReport &report)
        : artifacts_{artifacts}, report_{report}, settled_(artifacts.size(), 0U)
    {
    }

    /// records a terminal state once; later calls for the same artifact are no-ops
    void settle(ArtifactId id, AssemblyState state)
    {
        if (settled_[id] != 0U)
        {
            return;
        }
        settled_[id]     = 1U;
        auto &artifact   = artifacts_[id];
        artifact.stage   = ArtifactStage::Finalized;
        report_.record(id, artifact.name, artifact.format.format, std::move(state));
    }

    [[nodiscard]] auto pending() const -> std::vector<ArtifactId>
    {
        std::vector<ArtifactId> ids;
        for (ArtifactId id = 0; id < settled_.size(); ++id)
        {
            if (settled_[id] == 0U)
            {
                ids.push_back(id);
            }
        }
        return ids;
    }

private:
    std::vector<Artifact>    &artifacts_;
    UploadReport             &report_;
    std::vector<std::uint8_t> settled_; ///< one slot per artifact, each written by a single thread
};

} // namespace

auto run_upload(const config::RunConfig &config, net::ChunkServer &server, const collect::Introspector &introspector,
                const Timing &timing, std::stop_token stop, RetryPolicy::JitterSource jitter)
    -> std::expected<RunSummary, Error>
{
    const RetryPolicy retry{config.upload, std::move(jitter)};

    // 1. capabilities: anything wrong here aborts before chunk work
    auto caps_result = fetch_capabilities(server, retry, timing, stop);
    if (!caps_result)
    {
        log::error(kComponent, describe(caps_result.error()));
        return std::unexpected(caps_result.error());
    }
    const auto caps        = std::move(*caps_result);
    const auto limits      = net::chunk_limits(caps);
    const auto compression = net::negotiate_compression(caps, config.upload.compression);
    const auto concurrency = net::effective_concurrency(caps, config.upload.concurrency);
    log::info(kComponent, std::format("server accepts chunks of {} bytes, {} per request, compression {}, {} worker(s)",
                                      caps.max_chunk_size, caps.max_chunk_count, net::to_string(compression),
                                      concurrency));

    // 2. discovery
    auto collection = collect::collect_artifacts(config.sources, config.filters, config.collect.dedup, introspector);
    auto &artifacts = collection.artifacts;
    log::info(kComponent, std::format("found {} artifact(s), {} duplicate(s) collapsed, {} skipped with diagnostics",
                                      artifacts.size(), collection.duplicates, collection.diagnostics.size()));

    UploadReport report;
    Run          run{artifacts, report};

    // 3. chunking, failures stay isolated to their artifact
    chunk::ChunkStore store;
    for (auto &failure : chunk::chunk_artifacts(artifacts, limits, store, concurrency))
    {
        run.settle(failure.id, AssemblyState::failed(std::move(failure.error)));
    }

    // 4. oracle: prune what the server already holds
    ChunkRegistry registry;
    std::size_t   already_on_server = 0U;
    if (const auto pending = run.pending(); !pending.empty())
    {
        std::vector<net::AssembleRequest> requests;
        requests.reserve(pending.size());
        for (const auto id : pending)
        {
            artifacts[id].stage = ArtifactStage::Uploading;
            requests.push_back(make_request(artifacts[id]));
        }

        auto known = run_with_retry(retry, timing, stop, "missing chunk query",
                                    [&] { return server.query_known(requests); });
        if (!known)
        {
            const auto &error = known.error().error;
            if (is_fatal_to_run(error.kind))
            {
                log::error(kComponent, describe(error));
                return std::unexpected(error);
            }
            log::warn(kComponent,
                      std::format("could not ask the server for known chunks, uploading everything: {}",
                                  describe(error)));
        }
        else
        {
            std::unordered_set<Checksum> present;
            for (const auto id : pending)
            {
                const auto &artifact = artifacts[id];
                if (known->complete.contains(artifact.checksum))
                {
                    log::info(kComponent, std::format("{} already assembled on the server", artifact.name));
                    run.settle(id, AssemblyState::complete());
                    continue;
                }
                for (const auto &checksum : artifact.chunks)
                {
                    if (!known->missing.contains(checksum))
                    {
                        present.insert(checksum);
                    }
                }
            }
            const std::vector<Checksum> uploaded(present.begin(), present.end());
            registry.mark_uploaded(uploaded);
            already_on_server = uploaded.size();
        }
    }

    // 5. planning
    std::vector<PlannedChunk>    planned;
    std::unordered_set<Checksum> queued;
    for (const auto id : run.pending())
    {
        for (const auto &checksum : artifacts[id].chunks)
        {
            if (registry.status(checksum) != ChunkStatus::Missing || !queued.insert(checksum).second)
            {
                continue;
            }
            const auto chunk = store.find(checksum);
            if (chunk)
            {
                planned.push_back(PlannedChunk{checksum, chunk->length});
            }
        }
    }

    const auto batch_limits = BatchLimits::from(caps);
    auto       plan         = plan_batches(std::move(planned), batch_limits);
    if (!plan)
    {
        log::error(kComponent, describe(plan.error()));
        return std::unexpected(plan.error());
    }
    for (const auto &rejected : plan->rejected)
    {
        const auto error = make_error(ErrorKind::ArtifactTooLarge, "chunk exceeds the server request limits",
                                      {rejected.checksum.hex()});
        const std::span<const Checksum> single{&rejected.checksum, 1U};
        registry.mark_failed(single, error);
        for (const auto owner : store.owners(rejected.checksum))
        {
            run.settle(owner, AssemblyState::failed(with_context(error, artifacts[owner].name)));
        }
    }
    log::info(kComponent, std::format("{} batch(es) planned, {} chunk(s) already on the server",
                                      plan->batches.size(), already_on_server));

    // 6. upload
    const auto repairer = [&](const Checksum &checksum) -> std::expected<void, Error>
    {
        const auto owners = store.owners(checksum);
        if (owners.empty())
        {
            return std::unexpected(make_error(ErrorKind::ChecksumMismatch, "chunk has no owning artifact",
                                              {checksum.hex()}));
        }
        return chunk::repair(checksum, artifacts[owners.front()], limits, store);
    };
    UploadExecutor executor{server,
                            store,
                            registry,
                            retry,
                            timing,
                            stop,
                            ExecutorOptions{compression, concurrency},
                            repairer};
    // failed chunks are already Failed in the registry; the assembly barrier turns them into artifact errors
    for (const auto &outcome : executor.upload_all(plan->batches))
    {
        if (outcome.error)
        {
            log::warn(kComponent, std::format("batch {} failed after {} attempt(s): {}", outcome.index,
                                              outcome.attempts, describe(*outcome.error)));
        }
    }

    // 7. assembly, one independent state machine per artifact
    AssemblyCoordinator coordinator{server,
                                    store,
                                    registry,
                                    executor,
                                    batch_limits,
                                    retry,
                                    timing,
                                    stop,
                                    AssemblyOptions{config.assembly.poll_interval,
                                                    net::effective_max_wait(caps, config.assembly.max_wait),
                                                    config.assembly.missing_chunk_rounds,
                                                    config.assembly.wait}};
    if (const auto pending = run.pending(); !pending.empty())
    {
        WorkerPool pool{std::min<std::size_t>(concurrency, pending.size())};
        for (const auto id : pending)
        {
            pool.submit(
                [&, id]
                {
                    artifacts[id].stage = ArtifactStage::Assembling;
                    run.settle(id, coordinator.assemble(artifacts[id]));
                });
        }
        pool.wait_idle();
    }

    // 8. summary
    auto       summary = report.finish();
    const auto stats   = executor.stats();
    summary.counters   = RunCounters{artifacts.size(),
                                   collection.duplicates,
                                   store.size(),
                                   already_on_server,
                                   stats.batches_sent,
                                   stats.batches_failed,
                                   stats.bytes_sent,
                                   stats.retries,
                                   collection.diagnostics.size()};
    log::info(kComponent, std::format("{} completed, {} failed, {} timed out, {} pending", summary.completed.size(),
                                      summary.failed.size(), summary.timed_out.size(), summary.pending.size()));
    return summary;
}

} // namespace ckw::upload
