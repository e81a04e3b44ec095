/**
 * @file zip_archive.hpp
 * @brief read-only ZIP access so artifacts nested in archives get collected too
 *
 * only the subset real symbol bundles use: single-disk archives, stored and
 * deflate entries, no encryption, no zip64. anything fancier is reported per
 * entry (or per archive when the directory itself is unreadable) and skipped.
 *
 * entries are listed in central-directory order, which is also the order the
 * collector treats as "walk order" for dedup tie-breaking.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "ckw/common/error.hpp"

namespace ckw::collect
{

struct ZipEntry
{
    std::string   name;
    std::uint16_t method{0U};            ///< 0 stored, 8 deflate
    std::uint16_t flags{0U};             ///< general purpose bit flags
    std::uint32_t crc32{0U};
    std::uint64_t compressed_size{0U};
    std::uint64_t uncompressed_size{0U};
    std::uint64_t local_header_offset{0U};

    [[nodiscard]] auto is_directory() const noexcept -> bool
    {
        return !name.empty() && name.back() == '/';
    }
};

class ZipArchive
{
public:
    /**
     * @brief opens an archive and reads its central directory
     *
     * ⚠️ IMPURE FUNCTION (reads the file system)
     *
     * @return archive handle, or IoError when the file is not a readable zip
     */
    [[nodiscard]] static auto open(const std::filesystem::path &path) -> std::expected<ZipArchive, Error>;

    /**
     * @brief true when the slice starts with a local file header signature
     */
    [[nodiscard]] static auto looks_like_zip(std::span<const std::byte> head) noexcept -> bool;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path &
    {
        return path_;
    }

    [[nodiscard]] auto entries() const noexcept -> const std::vector<ZipEntry> &
    {
        return entries_;
    }

    /**
     * @brief decompresses one entry and verifies its CRC-32
     *
     * ⚠️ IMPURE FUNCTION (reads the file system)
     */
    [[nodiscard]] auto read(const ZipEntry &entry) const -> std::expected<std::vector<std::byte>, Error>;

    /**
     * @brief reads an entry by name (used when re-reading an artifact)
     */
    [[nodiscard]] auto read(const std::string &name) const -> std::expected<std::vector<std::byte>, Error>;

private:
    ZipArchive(std::filesystem::path path, std::vector<ZipEntry> entries);

    std::filesystem::path path_{};
    std::vector<ZipEntry> entries_{};
};

} // namespace ckw::collect
