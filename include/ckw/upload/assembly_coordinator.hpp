/**
 * @file assembly_coordinator.hpp
 * @brief drives each artifact's assembly state machine to a terminal state
 *
 *   Requested ──ok──────────────▶ Complete
 *       │ created/assembling
 *       ▼
 *   InProgress ──poll──▶ (same answers as above, until max_wait) ──▶ Error(AssemblyTimeout)
 *       │ not_found + missing list
 *       ▼
 *   MissingChunks ──re-upload──▶ Requested   (at most missing_chunk_rounds times,
 *                                              then Error(PersistentlyMissingChunks))
 *   error ───────────────────────▶ Error(ServerRejected, detail)
 *
 * with `wait` off the first created/assembling answer ends the machine in
 * Pending instead of polling.
 *
 * re-uploads go through ChunkRegistry::claim, so a chunk shared by many
 * artifacts is re-sent once per round while the other artifacts wait on it.
 *
 * assembly is only requested after the barrier holds: every chunk of the
 * artifact is Uploaded in the ChunkRegistry. a Failed chunk short-circuits
 * the artifact to Error with that chunk's failure.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <vector>

#include "ckw/chunk/chunk_store.hpp"
#include "ckw/collect/artifact.hpp"
#include "ckw/common/timing.hpp"
#include "ckw/net/chunk_server.hpp"
#include "ckw/upload/batch_planner.hpp"
#include "ckw/upload/chunk_registry.hpp"
#include "ckw/upload/retry_policy.hpp"
#include "ckw/upload/upload_executor.hpp"

namespace ckw::upload
{

struct AssemblyOptions
{
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::seconds      max_wait{300};
    std::uint32_t             missing_chunk_rounds{2U};
    bool                      wait{true};
};

class AssemblyCoordinator
{
public:
    AssemblyCoordinator(net::ChunkServer &server, const chunk::ChunkStore &store, ChunkRegistry &registry,
                        UploadExecutor &executor, BatchLimits limits, RetryPolicy retry, Timing timing,
                        std::stop_token stop, AssemblyOptions options);

    /**
     * @brief runs the state machine for one artifact until it is terminal
     *
     * ⚠️ IMPURE FUNCTION (network, sleeps between polls)
     *
     * @return the terminal AssemblyState (Complete or Error)
     */
    [[nodiscard]] auto assemble(const Artifact &artifact) -> AssemblyState;

private:
    [[nodiscard]] auto reupload(const Artifact &artifact, const std::vector<Checksum> &missing, std::uint32_t round)
        -> std::expected<void, Error>;

    [[nodiscard]] auto send(const Artifact &artifact, const std::vector<Checksum> &chunks)
        -> std::expected<void, Error>;

    net::ChunkServer        &server_;
    const chunk::ChunkStore &store_;
    ChunkRegistry           &registry_;
    UploadExecutor          &executor_;
    BatchLimits              limits_;
    RetryPolicy              retry_;
    Timing                   timing_;
    std::stop_token          stop_;
    AssemblyOptions          options_;
};

} // namespace ckw::upload
