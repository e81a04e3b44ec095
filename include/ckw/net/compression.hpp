/**
 * @file compression.hpp
 * @brief gzip wrappers over zlib for chunk payloads
 *
 * compression only changes the wire bytes. chunk identity is always the
 * checksum of the uncompressed content.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <vector>

#include "ckw/common/error.hpp"

namespace ckw::net
{

/**
 * @brief gzip-framed deflate of the input
 *
 * ✨ PURE FUNCTION ✨ (modulo zlib allocations)
 */
[[nodiscard]] auto gzip_compress(std::span<const std::byte> input) -> std::expected<std::vector<std::byte>, Error>;

/**
 * @brief inverse of gzip_compress (used by servers and tests)
 */
[[nodiscard]] auto gzip_decompress(std::span<const std::byte> input) -> std::expected<std::vector<std::byte>, Error>;

} // namespace ckw::net
