/**
 * @file zip_archive.cpp
 * @brief central-directory walk plus zlib raw inflate for deflate entries
 */
#include "ckw/collect/zip_archive.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace ckw::collect
{
namespace
{

constexpr std::uint32_t kLocalFileHeaderSignature        = 0x04034B50U;
constexpr std::uint32_t kCentralDirectoryHeaderSignature = 0x02014B50U;
constexpr std::uint32_t kEndOfCentralDirectorySignature  = 0x06054B50U;
constexpr std::size_t   kEndOfCentralDirectorySize       = 22U;
constexpr std::size_t   kMaxCommentSize                  = 0xFFFFU;
constexpr std::size_t   kCentralHeaderSize               = 46U;
constexpr std::size_t   kLocalHeaderSize                 = 30U;
constexpr std::uint16_t kMethodStore                     = 0U;
constexpr std::uint16_t kMethodDeflate                   = 8U;
constexpr std::uint16_t kFlagEncrypted                   = 0x0001U;
constexpr std::uint32_t kZip64Marker                     = 0xFFFFFFFFU;
constexpr std::uint64_t kMaxDeflateRatio                 = 1032U;  ///< best case for deflate

[[nodiscard]] auto le16(std::span<const std::byte> bytes, std::size_t offset) noexcept -> std::uint16_t
{
    return static_cast<std::uint16_t>(std::to_integer<std::uint16_t>(bytes[offset]) |
                                      (std::to_integer<std::uint16_t>(bytes[offset + 1U]) << 8U));
}

[[nodiscard]] auto le32(std::span<const std::byte> bytes, std::size_t offset) noexcept -> std::uint32_t
{
    return std::to_integer<std::uint32_t>(bytes[offset]) | (std::to_integer<std::uint32_t>(bytes[offset + 1U]) << 8U) |
           (std::to_integer<std::uint32_t>(bytes[offset + 2U]) << 16U) |
           (std::to_integer<std::uint32_t>(bytes[offset + 3U]) << 24U);
}

[[nodiscard]] auto io_error(const std::filesystem::path &path, std::string message) -> Error
{
    return make_error(ErrorKind::IoError, std::move(message), {path.string()});
}

/**
 * @brief reads [offset, offset + length) from a file
 *
 * the range is checked against the size on disk before anything is
 * allocated, so a lying header can't ask for gigabytes
 */
[[nodiscard]] auto read_range(const std::filesystem::path &path, std::uint64_t offset, std::uint64_t length)
    -> std::expected<std::vector<std::byte>, Error>
{
    std::error_code ec;
    const auto      file_size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        return std::unexpected(io_error(path, std::format("cannot stat archive: {}", ec.message())));
    }
    if (offset > file_size || length > file_size - offset)
    {
        return std::unexpected(io_error(path, "archive truncated"));
    }

    std::ifstream stream{path, std::ios::binary};
    if (!stream)
    {
        return std::unexpected(io_error(path, "failed to open archive"));
    }
    stream.seekg(static_cast<std::streamoff>(offset));
    std::vector<std::byte> buffer(static_cast<std::size_t>(length));
    stream.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(length));
    if (static_cast<std::uint64_t>(stream.gcount()) != length)
    {
        return std::unexpected(io_error(path, "archive truncated"));
    }
    return buffer;
}

[[nodiscard]] auto inflate_raw(std::span<const std::byte> compressed, std::uint64_t expected_size,
                               const std::string &entry) -> std::expected<std::vector<std::byte>, Error>
{
    if (expected_size > static_cast<std::uint64_t>(compressed.size()) * kMaxDeflateRatio)
    {
        return std::unexpected(make_error(
            ErrorKind::CompressionFailed,
            std::format("declared size {} is impossible for {} compressed byte(s)", expected_size, compressed.size()),
            {entry}));
    }
    std::vector<std::byte> output(static_cast<std::size_t>(expected_size));

    z_stream stream{};
    // negative window bits: raw deflate, zip entries carry no zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
    {
        return std::unexpected(make_error(ErrorKind::CompressionFailed, "inflateInit2 failed", {entry}));
    }
    stream.next_in   = reinterpret_cast<Bytef *>(const_cast<std::byte *>(compressed.data()));
    stream.avail_in  = static_cast<uInt>(compressed.size());
    stream.next_out  = reinterpret_cast<Bytef *>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    const auto status = inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    inflateEnd(&stream);

    if (status != Z_STREAM_END || produced != expected_size)
    {
        return std::unexpected(make_error(ErrorKind::CompressionFailed,
                                          std::format("deflate stream corrupt (zlib status {})", status),
                                          {entry}));
    }
    return output;
}

} // namespace

ZipArchive::ZipArchive(std::filesystem::path path, std::vector<ZipEntry> entries)
    : path_{std::move(path)}, entries_{std::move(entries)}
{
}

auto ZipArchive::looks_like_zip(std::span<const std::byte> head) noexcept -> bool
{
    return head.size() >= 4U && le32(head, 0U) == kLocalFileHeaderSignature;
}

auto ZipArchive::open(const std::filesystem::path &path) -> std::expected<ZipArchive, Error>
{
    std::error_code ec;
    const auto      file_size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        return std::unexpected(io_error(path, std::format("cannot stat archive: {}", ec.message())));
    }
    if (file_size < kEndOfCentralDirectorySize)
    {
        return std::unexpected(io_error(path, "file too small to be a zip archive"));
    }

    // the end record sits within the last 64 KiB + 22 bytes (comment is variable)
    const auto tail_size = std::min<std::uint64_t>(file_size, kEndOfCentralDirectorySize + kMaxCommentSize);
    auto       tail      = read_range(path, file_size - tail_size, tail_size);
    if (!tail)
    {
        return std::unexpected(tail.error());
    }

    std::optional<std::size_t> end_record;
    for (std::size_t pos = tail->size() - kEndOfCentralDirectorySize + 1U; pos-- > 0U;)
    {
        if (le32(*tail, pos) == kEndOfCentralDirectorySignature)
        {
            end_record = pos;
            break;
        }
    }
    if (!end_record)
    {
        return std::unexpected(io_error(path, "end of central directory not found"));
    }

    const auto entry_count      = le16(*tail, *end_record + 10U);
    const auto directory_size   = le32(*tail, *end_record + 12U);
    const auto directory_offset = le32(*tail, *end_record + 16U);
    if (directory_size == kZip64Marker || directory_offset == kZip64Marker)
    {
        return std::unexpected(io_error(path, "zip64 archives are not supported"));
    }
    if (static_cast<std::uint64_t>(directory_offset) + directory_size > file_size)
    {
        return std::unexpected(io_error(path, "central directory lies outside the file"));
    }

    auto directory = read_range(path, directory_offset, directory_size);
    if (!directory)
    {
        return std::unexpected(directory.error());
    }

    std::vector<ZipEntry> entries;
    entries.reserve(entry_count);
    std::size_t cursor = 0U;
    for (std::uint16_t i = 0; i < entry_count; ++i)
    {
        if (cursor + kCentralHeaderSize > directory->size() ||
            le32(*directory, cursor) != kCentralDirectoryHeaderSignature)
        {
            return std::unexpected(io_error(path, std::format("central directory entry {} is malformed", i)));
        }
        const auto name_length    = le16(*directory, cursor + 28U);
        const auto extra_length   = le16(*directory, cursor + 30U);
        const auto comment_length = le16(*directory, cursor + 32U);
        if (cursor + kCentralHeaderSize + name_length > directory->size())
        {
            return std::unexpected(io_error(path, std::format("central directory entry {} is truncated", i)));
        }

        ZipEntry entry;
        entry.flags               = le16(*directory, cursor + 8U);
        entry.method              = le16(*directory, cursor + 10U);
        entry.crc32               = le32(*directory, cursor + 16U);
        entry.compressed_size     = le32(*directory, cursor + 20U);
        entry.uncompressed_size   = le32(*directory, cursor + 24U);
        entry.local_header_offset = le32(*directory, cursor + 42U);
        const auto *name_begin    = reinterpret_cast<const char *>(directory->data() + cursor + kCentralHeaderSize);
        entry.name.assign(name_begin, name_length);
        entries.push_back(std::move(entry));

        cursor += kCentralHeaderSize + name_length + extra_length + comment_length;
    }

    return ZipArchive{path, std::move(entries)};
}

auto ZipArchive::read(const ZipEntry &entry) const -> std::expected<std::vector<std::byte>, Error>
{
    if ((entry.flags & kFlagEncrypted) != 0U)
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' is encrypted", entry.name)));
    }
    if (entry.method != kMethodStore && entry.method != kMethodDeflate)
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' uses unsupported compression method {}",
                                                               entry.name, entry.method)));
    }
    if (entry.uncompressed_size > std::numeric_limits<uInt>::max() ||
        entry.compressed_size > std::numeric_limits<uInt>::max())
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' is too large", entry.name)));
    }

    auto header = read_range(path_, entry.local_header_offset, kLocalHeaderSize);
    if (!header)
    {
        return std::unexpected(with_context(header.error(), entry.name));
    }
    if (le32(*header, 0U) != kLocalFileHeaderSignature)
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' has a corrupt local header", entry.name)));
    }
    const auto data_offset = entry.local_header_offset + kLocalHeaderSize + le16(*header, 26U) + le16(*header, 28U);

    auto raw = read_range(path_, data_offset, entry.compressed_size);
    if (!raw)
    {
        return std::unexpected(with_context(raw.error(), entry.name));
    }

    std::vector<std::byte> content;
    if (entry.method == kMethodStore)
    {
        if (entry.compressed_size != entry.uncompressed_size)
        {
            return std::unexpected(io_error(path_, std::format("stored entry '{}' has mismatched sizes", entry.name)));
        }
        content = std::move(*raw);
    }
    else
    {
        auto inflated = inflate_raw(*raw, entry.uncompressed_size, entry.name);
        if (!inflated)
        {
            return std::unexpected(with_context(inflated.error(), path_.string()));
        }
        content = std::move(*inflated);
    }

    const auto crc = ::crc32(0UL, reinterpret_cast<const Bytef *>(content.data()), static_cast<uInt>(content.size()));
    if (static_cast<std::uint32_t>(crc) != entry.crc32)
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' failed its CRC-32 check", entry.name)));
    }
    return content;
}

auto ZipArchive::read(const std::string &name) const -> std::expected<std::vector<std::byte>, Error>
{
    const auto found =
        std::find_if(entries_.begin(), entries_.end(), [&](const ZipEntry &entry) { return entry.name == name; });
    if (found == entries_.end())
    {
        return std::unexpected(io_error(path_, std::format("entry '{}' not found", name)));
    }
    return read(*found);
}

} // namespace ckw::collect
