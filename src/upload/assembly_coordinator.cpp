/**
 * @file assembly_coordinator.cpp
 * @brief per-artifact assemble / poll / re-upload loop
 */
#include "ckw/upload/assembly_coordinator.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

#include "ckw/common/log.hpp"

namespace ckw::upload
{
namespace
{

constexpr std::string_view kComponent = "assemble";

} // namespace

AssemblyCoordinator::AssemblyCoordinator(net::ChunkServer &server, const chunk::ChunkStore &store,
                                         ChunkRegistry &registry, UploadExecutor &executor, BatchLimits limits,
                                         RetryPolicy retry, Timing timing, std::stop_token stop,
                                         AssemblyOptions options)
    : server_{server},
      store_{store},
      registry_{registry},
      executor_{executor},
      limits_{limits},
      retry_{std::move(retry)},
      timing_{std::move(timing)},
      stop_{std::move(stop)},
      options_{options}
{
}

auto AssemblyCoordinator::send(const Artifact &artifact, const std::vector<Checksum> &chunks)
    -> std::expected<void, Error>
{
    std::vector<PlannedChunk> planned;
    planned.reserve(chunks.size());
    for (const auto &checksum : chunks)
    {
        const auto chunk = store_.find(checksum);
        if (!chunk)
        {
            return std::unexpected(
                make_error(ErrorKind::ProtocolError, "chunk is not in the store", {artifact.name, checksum.hex()}));
        }
        planned.push_back(PlannedChunk{checksum, chunk->length});
    }

    auto plan = plan_batches(std::move(planned), limits_);
    if (!plan)
    {
        return std::unexpected(with_context(plan.error(), artifact.name));
    }
    if (!plan->rejected.empty())
    {
        return std::unexpected(make_error(ErrorKind::ArtifactTooLarge, "chunk exceeds the server request limits",
                                          {artifact.name, plan->rejected.front().checksum.hex()}));
    }

    for (const auto &batch : plan->batches)
    {
        const auto outcome = executor_.upload(batch);
        if (outcome.error)
        {
            return std::unexpected(with_context(*outcome.error, artifact.name));
        }
    }
    return {};
}

auto AssemblyCoordinator::reupload(const Artifact &artifact, const std::vector<Checksum> &missing,
                                   std::uint32_t round) -> std::expected<void, Error>
{
    auto pending = missing;
    while (true)
    {
        // chunks another artifact is already sending are waited on, not sent twice
        const auto claimed = registry_.claim(pending, round);
        if (!claimed.empty())
        {
            auto sent = send(artifact, claimed);
            registry_.release(claimed, round);
            if (!sent)
            {
                return sent;
            }
        }

        const auto barrier = registry_.check(missing);
        if (barrier.failure)
        {
            return std::unexpected(with_context(*barrier.failure, artifact.name));
        }
        if (barrier.missing.empty())
        {
            return {};
        }
        if (stop_.stop_requested())
        {
            return std::unexpected(make_error(ErrorKind::Cancelled, "run cancelled", {artifact.name}));
        }
        pending = barrier.missing;
    }
}

auto AssemblyCoordinator::assemble(const Artifact &artifact) -> AssemblyState
{
    AssemblyState state = AssemblyState::requested();
    const auto    settle = [&](AssemblyState next) -> AssemblyState
    {
        transition(state, std::move(next));
        if (state.phase == AssemblyPhase::Complete)
        {
            log::info(kComponent, std::format("{} assembled", artifact.name));
        }
        else if (state.phase == AssemblyPhase::Pending)
        {
            log::info(kComponent, std::format("{} accepted, server still processing", artifact.name));
        }
        else if (state.error)
        {
            log::warn(kComponent, std::format("{} failed: {}", artifact.name, describe(*state.error)));
        }
        return state;
    };
    const auto cancelled = [&]
    { return AssemblyState::failed(make_error(ErrorKind::Cancelled, "run cancelled", {artifact.name})); };

    // barrier: nothing is requested before every chunk is on the server
    const auto barrier = registry_.check(artifact.chunks);
    if (barrier.failure)
    {
        return settle(AssemblyState::failed(with_context(*barrier.failure, artifact.name)));
    }
    if (!barrier.missing.empty())
    {
        if (stop_.stop_requested())
        {
            return settle(cancelled());
        }
        if (auto sent = reupload(artifact, barrier.missing, 0U); !sent)
        {
            return settle(AssemblyState::failed(sent.error()));
        }
    }

    net::AssembleRequest request{artifact.checksum, artifact.chunks, artifact.name, std::nullopt};
    if (!artifact.format.identifiers.empty())
    {
        request.debug_id = artifact.format.identifiers.front();
    }

    const auto    started = timing_.now();
    std::uint32_t rounds  = 0U;
    while (true)
    {
        if (stop_.stop_requested())
        {
            return settle(cancelled());
        }

        auto response = run_with_retry(retry_, timing_, stop_, std::format("assemble {}", artifact.name),
                                       [&] { return server_.assemble(request); });
        if (!response)
        {
            return settle(AssemblyState::failed(with_context(response.error().error, artifact.name)));
        }

        switch (response->state)
        {
        case net::RemoteState::Ok:
            return settle(AssemblyState::complete());

        case net::RemoteState::Created:
        case net::RemoteState::Assembling:
        {
            transition(state, AssemblyState::in_progress());
            if (!options_.wait)
            {
                return settle(AssemblyState::pending());
            }
            const auto elapsed =
                std::chrono::duration_cast<std::chrono::milliseconds>(timing_.now() - started);
            const auto max_wait = std::chrono::duration_cast<std::chrono::milliseconds>(options_.max_wait);
            if (elapsed >= max_wait)
            {
                return settle(AssemblyState::failed(make_error(
                    ErrorKind::AssemblyTimeout,
                    std::format("server still assembling after {}s",
                                std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()),
                    {artifact.name})));
            }
            timing_.sleep(std::min(options_.poll_interval, max_wait - elapsed), stop_);
            break;
        }

        case net::RemoteState::NotFound:
        {
            std::vector<Checksum> missing;
            for (const auto &checksum : response->missing_chunks)
            {
                const bool ours =
                    std::find(artifact.chunks.begin(), artifact.chunks.end(), checksum) != artifact.chunks.end();
                if (ours && std::find(missing.begin(), missing.end(), checksum) == missing.end())
                {
                    missing.push_back(checksum);
                }
            }
            if (missing.empty())
            {
                return settle(AssemblyState::failed(make_error(
                    ErrorKind::ServerRejected,
                    response->missing_chunks.empty() ? "server reported not_found without missing chunks"
                                                     : "server asked for chunks the artifact does not contain",
                    {artifact.name})));
            }

            transition(state, AssemblyState::missing_chunks(missing));
            if (rounds >= options_.missing_chunk_rounds)
            {
                return settle(AssemblyState::failed(make_error(
                    ErrorKind::PersistentlyMissingChunks,
                    std::format("{} chunk(s) still missing after {} re-upload round(s)", missing.size(), rounds),
                    {artifact.name})));
            }
            ++rounds;
            log::info(kComponent, std::format("{} missing {} chunk(s), re-upload round {}", artifact.name,
                                              missing.size(), rounds));
            if (auto sent = reupload(artifact, missing, rounds); !sent)
            {
                return settle(AssemblyState::failed(sent.error()));
            }
            transition(state, AssemblyState::requested());
            break;
        }

        case net::RemoteState::Error:
            return settle(AssemblyState::failed(make_error(
                ErrorKind::ServerRejected, response->detail.empty() ? "assembly failed" : response->detail,
                {artifact.name})));
        }
    }
}

} // namespace ckw::upload
