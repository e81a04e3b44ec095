/**
 * @file chunk_server.hpp
 * @brief the collaborator seam: everything the engine asks of a chunk server
 *
 * the engine never speaks HTTP directly. it talks to a ChunkServer, which the
 * CLI backs with libcurl (HttpChunkServer) and the test suite backs with a
 * scripted in-memory fake. every call returns std::expected with a
 * RequestFailure that carries the classified Error plus the transport
 * details the retry policy needs (status, Retry-After).
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/common/error.hpp"
#include "ckw/net/capabilities.hpp"

namespace ckw::net
{

/**
 * @brief classified failure of a single request
 */
struct RequestFailure
{
    Error                error;
    std::uint32_t        status{0U};      ///< HTTP status, 0 for transport errors
    std::chrono::seconds retry_after{0};  ///< server-requested minimum wait, 0 when absent
};

template <typename T>
using RequestResult = std::expected<T, RequestFailure>;

/**
 * @brief assembly request for one artifact
 */
struct AssembleRequest
{
    Checksum                   checksum{};
    std::vector<Checksum>      chunks;
    std::string                name;
    std::optional<std::string> debug_id;
};

/**
 * @brief server-side artifact state as reported on the wire
 */
enum class RemoteState : std::uint8_t
{
    Ok,
    Created,
    Assembling,
    NotFound,
    Error
};

[[nodiscard]] auto to_string(RemoteState state) noexcept -> std::string_view;

[[nodiscard]] auto parse_remote_state(std::string_view raw) -> std::optional<RemoteState>;

struct AssembleResponse
{
    RemoteState           state{RemoteState::NotFound};
    std::vector<Checksum> missing_chunks;
    std::string           detail;
};

/**
 * @brief answer of the checksum oracle for a set of pending artifacts
 */
struct KnownContent
{
    std::unordered_set<Checksum> complete;  ///< artifact checksums already assembled server-side
    std::unordered_set<Checksum> missing;   ///< chunk checksums the server does not hold
};

/**
 * @brief one upload request worth of chunk bytes (already compressed if any)
 */
struct BatchPayload
{
    Compression                                             compression{Compression::Uncompressed};
    std::vector<std::pair<Checksum, std::vector<std::byte>>> parts;
};

class ChunkServer
{
public:
    virtual ~ChunkServer() = default;

    /**
     * @brief GET the capability document
     */
    [[nodiscard]] virtual auto fetch_capabilities() -> RequestResult<ServerCapabilities> = 0;

    /**
     * @brief which of these artifacts/chunks does the server already hold?
     */
    [[nodiscard]] virtual auto query_known(const std::vector<AssembleRequest> &requests)
        -> RequestResult<KnownContent> = 0;

    /**
     * @brief POST one batch of chunks (multipart on HTTP)
     */
    [[nodiscard]] virtual auto upload_batch(const BatchPayload &payload) -> RequestResult<void> = 0;

    /**
     * @brief request (or poll) assembly of one artifact
     */
    [[nodiscard]] virtual auto assemble(const AssembleRequest &request) -> RequestResult<AssembleResponse> = 0;
};

} // namespace ckw::net
