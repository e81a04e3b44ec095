/**
 * @file http_chunk_server.hpp
 * @brief libcurl implementation of the ChunkServer seam
 *
 * routes (relative to the configured base url):
 * - GET  /api/0/organizations/{org}/chunk-upload/            capabilities
 * - POST <capabilities.url>                                   chunk batches
 * - POST /api/0/projects/{org}/{project}/files/difs/assemble/ assembly + known-chunk query
 *
 * one easy handle per request, so concurrent calls from worker threads never
 * share curl state. ⚠️ IMPURE (network I/O)
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "ckw/config/config.hpp"
#include "ckw/net/chunk_server.hpp"

namespace ckw::net
{

struct HttpSettings
{
    std::string          base_url;
    std::string          org;
    std::string          project;
    std::string          auth_token;
    std::chrono::seconds timeout{60};
    std::string          user_agent{"chunkwave/1.0"};

    [[nodiscard]] static auto from_config(const config::ServerSettings &server) -> HttpSettings;
};

/// capabilities route with the org slug percent-encoded ✨ PURE FUNCTION ✨
[[nodiscard]] auto capabilities_url(const HttpSettings &settings) -> std::string;

/// assemble route with org and project slugs percent-encoded ✨ PURE FUNCTION ✨
[[nodiscard]] auto assemble_url(const HttpSettings &settings) -> std::string;

class HttpChunkServer final : public ChunkServer
{
public:
    explicit HttpChunkServer(HttpSettings settings);

    [[nodiscard]] auto fetch_capabilities() -> RequestResult<ServerCapabilities> override;
    [[nodiscard]] auto query_known(const std::vector<AssembleRequest> &requests) -> RequestResult<KnownContent> override;
    [[nodiscard]] auto upload_batch(const BatchPayload &payload) -> RequestResult<void> override;
    [[nodiscard]] auto assemble(const AssembleRequest &request) -> RequestResult<AssembleResponse> override;

private:
    struct Response
    {
        std::uint32_t        status{0U};
        std::string          body;
        std::chrono::seconds retry_after{0};
    };

    [[nodiscard]] auto perform(const std::string &url, const std::string *body, const std::string &content_type)
        -> RequestResult<Response>;
    [[nodiscard]] auto post_assemble(const std::vector<AssembleRequest> &requests)
        -> RequestResult<std::unordered_map<Checksum, AssembleResponse>>;
    [[nodiscard]] auto resolve(const std::string &url) const -> std::string;
    [[nodiscard]] auto upload_url() const -> std::string;

    HttpSettings       settings_{};
    mutable std::mutex upload_url_mutex_{};
    std::string        upload_url_{};
};

} // namespace ckw::net
