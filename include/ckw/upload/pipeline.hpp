/**
 * @file pipeline.hpp
 * @brief end-to-end orchestration of one upload run
 *
 * collect → chunk → ask the server what it already has → plan → upload →
 * assemble → summarize. run-level failures (auth, capabilities, config) come
 * back as the unexpected branch before any chunk work starts; everything
 * per-artifact lands in the RunSummary instead.
 *
 * ⚠️ IMPURE (file system reads, network via the ChunkServer, worker threads)
 */
#pragma once

#include <expected>
#include <stop_token>

#include "ckw/collect/introspect.hpp"
#include "ckw/common/error.hpp"
#include "ckw/common/timing.hpp"
#include "ckw/config/config.hpp"
#include "ckw/net/chunk_server.hpp"
#include "ckw/upload/retry_policy.hpp"
#include "ckw/upload/upload_report.hpp"

namespace ckw::upload
{

/**
 * @brief runs one upload from discovery to the final summary
 *
 * @param[in] config already-validated run configuration
 * @param[in] server chunk server collaborator (HTTP in production, scripted in tests)
 * @param[in] introspector format capability deciding what counts as an artifact
 * @param[in] timing clock and sleeper used for backoff and assembly polling
 * @param[in] stop run-level abort signal
 * @param[in] jitter optional jitter sampler for the retry policy
 * @return RunSummary, or the run-level error that aborted the run
 */
[[nodiscard]] auto run_upload(const config::RunConfig &config, net::ChunkServer &server,
                              const collect::Introspector &introspector, const Timing &timing, std::stop_token stop,
                              RetryPolicy::JitterSource jitter = {}) -> std::expected<RunSummary, Error>;

} // namespace ckw::upload
