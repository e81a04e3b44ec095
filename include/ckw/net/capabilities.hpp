/**
 * @file capabilities.hpp
 * @brief server-advertised limits, fetched once per run and then frozen
 *
 * every downstream limit (chunk size, batch shape, file cap, compression,
 * concurrency ceiling) comes from here. validate() rejects documents the
 * engine cannot honor (zero sizes, a chunk larger than a request, a hash
 * algorithm other than sha1), which aborts the run with CapabilityFetchError.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ckw/chunk/chunker.hpp"
#include "ckw/common/error.hpp"

namespace ckw::net
{

/**
 * @brief wire compression modes, ordered by preference (higher wins)
 */
enum class Compression : std::uint8_t
{
    Uncompressed = 0U,
    Gzip         = 10U
};

[[nodiscard]] auto to_string(Compression compression) noexcept -> std::string_view;

/**
 * @brief parses "uncompressed" / "gzip", nullopt for modes we cannot speak
 */
[[nodiscard]] auto parse_compression(std::string_view raw) -> std::optional<Compression>;

struct ServerCapabilities
{
    std::string               upload_url;                 ///< chunk upload endpoint (absolute or relative)
    std::uint64_t             max_chunk_size{0U};          ///< chunkSize
    std::uint64_t             max_chunk_count{0U};         ///< chunksPerRequest
    std::uint64_t             max_request_bytes{0U};       ///< maxRequestSize
    std::uint64_t             max_file_size{0U};           ///< 0 when the server sets none
    std::chrono::seconds      max_wait{0};                 ///< 0 when the server sets none
    std::uint32_t             concurrency{0U};             ///< 0 when the server sets none
    std::string               hash_algorithm{"sha1"};
    std::vector<Compression>  compression;                 ///< supported modes, unknown ones dropped
    std::vector<std::string>  accept;                      ///< capability names, informational
};

/**
 * @brief checks the document is one the engine can honor
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto validate(const ServerCapabilities &caps) -> std::expected<void, Error>;

/**
 * @brief best mode the server supports, Uncompressed when disabled locally
 */
[[nodiscard]] auto negotiate_compression(const ServerCapabilities &caps, bool enabled) noexcept -> Compression;

/**
 * @brief projection used by the chunker
 */
[[nodiscard]] auto chunk_limits(const ServerCapabilities &caps) noexcept -> chunk::ChunkLimits;

/**
 * @brief effective worker count, min(config, server) when the server sets one
 */
[[nodiscard]] auto effective_concurrency(const ServerCapabilities &caps, std::uint32_t configured) noexcept
    -> std::uint32_t;

/**
 * @brief effective assembly wait, min(config, server) when the server sets one
 */
[[nodiscard]] auto effective_max_wait(const ServerCapabilities &caps, std::chrono::seconds configured) noexcept
    -> std::chrono::seconds;

} // namespace ckw::net
