/**
 * @file wire.hpp
 * @brief JSON + multipart codecs for the chunk server protocol
 *
 * JSON goes through yaml-cpp (JSON is a YAML 1.2 flow document, and the
 * emitter's EscapeAsJson mode produces strict JSON), so the whole project
 * shares one structured-text library.
 *
 * documents handled here:
 * - capability document (camelCase keys, see ServerCapabilities)
 * - assemble request: {"<checksum>": {"name", "chunks", "debug_id"?}, ...}
 * - assemble response: {"<checksum>": {"state", "missingChunks", "detail"?}, ...}
 * - multipart/form-data chunk upload body
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/common/error.hpp"
#include "ckw/net/capabilities.hpp"
#include "ckw/net/chunk_server.hpp"

namespace ckw::net::wire
{

/**
 * @brief decodes the capability JSON (ProtocolError on malformed input)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto parse_capabilities(std::string_view json) -> std::expected<ServerCapabilities, Error>;

/**
 * @brief encodes a capability document (servers and test fixtures use this)
 */
[[nodiscard]] auto encode_capabilities(const ServerCapabilities &caps) -> std::string;

/**
 * @brief encodes one or more assembly requests as a checksum-keyed map
 */
[[nodiscard]] auto encode_assemble_requests(const std::vector<AssembleRequest> &requests) -> std::string;

/**
 * @brief decodes a checksum-keyed assembly request map
 */
[[nodiscard]] auto parse_assemble_requests(std::string_view json) -> std::expected<std::vector<AssembleRequest>, Error>;

using AssembleResponses = std::unordered_map<Checksum, AssembleResponse>;

/**
 * @brief encodes a checksum-keyed assembly response map
 */
[[nodiscard]] auto encode_assemble_responses(const AssembleResponses &responses) -> std::string;

/**
 * @brief decodes a checksum-keyed assembly response map
 */
[[nodiscard]] auto parse_assemble_responses(std::string_view json) -> std::expected<AssembleResponses, Error>;

/**
 * @brief multipart/form-data body, one part per chunk
 *
 * part name is "file" (or "file_gzip" for gzip payloads), the filename is the
 * chunk checksum in hex.
 */
[[nodiscard]] auto encode_multipart(const BatchPayload &payload, std::string_view boundary) -> std::string;

[[nodiscard]] auto multipart_content_type(std::string_view boundary) -> std::string;

/**
 * @brief maps an HTTP status to the error taxonomy, nullopt for 2xx
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto classify_status(std::uint32_t status) noexcept -> std::optional<ErrorKind>;

/**
 * @brief parses a delta-seconds Retry-After header, 0 when absent or unparsable
 */
[[nodiscard]] auto parse_retry_after(std::string_view header) noexcept -> std::chrono::seconds;

} // namespace ckw::net::wire
