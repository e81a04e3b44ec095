/**
 * @file capabilities.cpp
 * @brief capability validation and negotiation helpers
 */
#include "ckw/net/capabilities.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace ckw::net
{

auto to_string(Compression compression) noexcept -> std::string_view
{
    switch (compression)
    {
    case Compression::Uncompressed:
        return "uncompressed";
    case Compression::Gzip:
        return "gzip";
    }
    return "unknown";
}

auto parse_compression(std::string_view raw) -> std::optional<Compression>
{
    if (raw == "uncompressed" || raw == "none")
    {
        return Compression::Uncompressed;
    }
    if (raw == "gzip")
    {
        return Compression::Gzip;
    }
    return std::nullopt;
}

auto validate(const ServerCapabilities &caps) -> std::expected<void, Error>
{
    const auto fail = [](std::string message)
    { return std::unexpected(make_error(ErrorKind::CapabilityFetchError, std::move(message), {"capabilities"})); };

    if (caps.hash_algorithm != "sha1")
    {
        return fail(std::format("unsupported hash algorithm '{}'", caps.hash_algorithm));
    }
    if (caps.max_chunk_size == 0U)
    {
        return fail("chunkSize must be > 0");
    }
    if (caps.max_chunk_count == 0U)
    {
        return fail("chunksPerRequest must be > 0");
    }
    if (caps.max_request_bytes == 0U)
    {
        return fail("maxRequestSize must be > 0");
    }
    if (caps.max_chunk_size > caps.max_request_bytes)
    {
        return fail(std::format("chunkSize {} exceeds maxRequestSize {}", caps.max_chunk_size, caps.max_request_bytes));
    }
    if (caps.upload_url.empty())
    {
        return fail("upload url is missing");
    }
    return {};
}

auto negotiate_compression(const ServerCapabilities &caps, bool enabled) noexcept -> Compression
{
    if (!enabled || caps.compression.empty())
    {
        return Compression::Uncompressed;
    }
    return *std::max_element(caps.compression.begin(), caps.compression.end());
}

auto chunk_limits(const ServerCapabilities &caps) noexcept -> chunk::ChunkLimits
{
    return chunk::ChunkLimits{caps.max_chunk_size, caps.max_chunk_count, caps.max_file_size};
}

auto effective_concurrency(const ServerCapabilities &caps, std::uint32_t configured) noexcept -> std::uint32_t
{
    const auto value = caps.concurrency == 0U ? configured : std::min(configured, caps.concurrency);
    return std::max<std::uint32_t>(value, 1U);
}

auto effective_max_wait(const ServerCapabilities &caps, std::chrono::seconds configured) noexcept
    -> std::chrono::seconds
{
    if (caps.max_wait.count() == 0)
    {
        return configured;
    }
    return std::min(configured, caps.max_wait);
}

} // namespace ckw::net
