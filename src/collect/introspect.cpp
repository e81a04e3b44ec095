/**
 * @file introspect.cpp
 * @brief ELF / Mach-O / Breakpad identifier extraction
 *
 * all readers go through ByteReader which refuses out-of-range reads, so a
 * malformed header can never walk us off the end of the slice.
 */
#include "ckw/collect/introspect.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace ckw::collect
{
namespace
{

constexpr std::string_view kHexDigits = "0123456789abcdef";

constexpr std::uint32_t kElfNoteSection   = 7U; // SHT_NOTE
constexpr std::uint32_t kElfNoteSegment   = 4U; // PT_NOTE
constexpr std::uint32_t kGnuBuildIdNote   = 3U; // NT_GNU_BUILD_ID
constexpr std::uint32_t kMachUuidCommand  = 0x1BU; // LC_UUID
constexpr std::uint32_t kMachMagic32      = 0xFEEDFACEU;
constexpr std::uint32_t kMachMagic64      = 0xFEEDFACFU;
constexpr std::uint32_t kMachCigam32      = 0xCEFAEDFEU;
constexpr std::uint32_t kMachCigam64      = 0xCFFAEDFEU;

/**
 * @brief bounds-checked fixed-width reads with selectable endianness
 */
class ByteReader
{
public:
    ByteReader(std::span<const std::byte> bytes, bool little_endian) noexcept
        : bytes_{bytes}, little_endian_{little_endian}
    {
    }

    [[nodiscard]] auto fits(std::uint64_t offset, std::uint64_t length) const noexcept -> bool
    {
        return offset <= bytes_.size() && length <= bytes_.size() - offset;
    }

    [[nodiscard]] auto u16(std::uint64_t offset) const noexcept -> std::optional<std::uint16_t>
    {
        const auto value = read(offset, 2U);
        if (!value)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(*value);
    }

    [[nodiscard]] auto u32(std::uint64_t offset) const noexcept -> std::optional<std::uint32_t>
    {
        const auto value = read(offset, 4U);
        if (!value)
        {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(*value);
    }

    /// reads a 32- or 64-bit word depending on the ELF class
    [[nodiscard]] auto word(std::uint64_t offset, bool wide) const noexcept -> std::optional<std::uint64_t>
    {
        return read(offset, wide ? 8U : 4U);
    }

    [[nodiscard]] auto slice(std::uint64_t offset, std::uint64_t length) const noexcept
        -> std::optional<std::span<const std::byte>>
    {
        if (!fits(offset, length))
        {
            return std::nullopt;
        }
        return bytes_.subspan(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
    }

private:
    [[nodiscard]] auto read(std::uint64_t offset, std::size_t width) const noexcept -> std::optional<std::uint64_t>
    {
        if (!fits(offset, width))
        {
            return std::nullopt;
        }
        std::uint64_t value = 0U;
        for (std::size_t i = 0; i < width; ++i)
        {
            const auto index = little_endian_ ? (width - 1U - i) : i;
            value            = (value << 8U) | std::to_integer<std::uint64_t>(bytes_[offset + index]);
        }
        return value;
    }

    std::span<const std::byte> bytes_{};
    bool                       little_endian_{true};
};

[[nodiscard]] auto to_hex(std::span<const std::byte> bytes) -> std::string
{
    std::string out;
    out.reserve(bytes.size() * 2U);
    for (const auto byte : bytes)
    {
        const auto value = std::to_integer<unsigned>(byte);
        out.push_back(kHexDigits[value >> 4U]);
        out.push_back(kHexDigits[value & 0x0FU]);
    }
    return out;
}

[[nodiscard]] constexpr auto align4(std::uint64_t value) noexcept -> std::uint64_t
{
    return (value + 3U) & ~static_cast<std::uint64_t>(3U);
}

/**
 * @brief scans one note blob for the GNU build id
 */
[[nodiscard]] auto find_build_id(const ByteReader &reader, std::uint64_t offset, std::uint64_t size)
    -> std::optional<std::string>
{
    if (!reader.fits(offset, size))
    {
        return std::nullopt;
    }
    const auto end = offset + size;
    auto       cursor = offset;
    while (cursor + 12U <= end)
    {
        const auto name_size = reader.u32(cursor);
        const auto desc_size = reader.u32(cursor + 4U);
        const auto note_type = reader.u32(cursor + 8U);
        if (!name_size || !desc_size || !note_type)
        {
            return std::nullopt;
        }
        const auto name_offset = cursor + 12U;
        const auto desc_offset = name_offset + align4(*name_size);
        const auto next        = desc_offset + align4(*desc_size);
        if (next > end)
        {
            return std::nullopt;
        }

        const auto name = reader.slice(name_offset, *name_size);
        if (*note_type == kGnuBuildIdNote && name && name->size() == 4U &&
            std::to_integer<char>((*name)[0]) == 'G' && std::to_integer<char>((*name)[1]) == 'N' &&
            std::to_integer<char>((*name)[2]) == 'U' && *desc_size > 0U)
        {
            const auto desc = reader.slice(desc_offset, *desc_size);
            if (desc)
            {
                return to_hex(*desc);
            }
        }
        cursor = next;
    }
    return std::nullopt;
}

[[nodiscard]] auto format_uuid(std::span<const std::byte> raw) -> std::string
{
    const auto hex = to_hex(raw);
    return std::format("{}-{}-{}-{}-{}", hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4), hex.substr(16, 4),
                       hex.substr(20, 12));
}

[[nodiscard]] auto is_space(char c) noexcept -> bool
{
    return c == ' ' || c == '\t';
}

} // namespace

auto identify_elf(std::span<const std::byte> bytes) -> std::optional<FormatInfo>
{
    constexpr std::array<char, 4> kMagic{'\x7f', 'E', 'L', 'F'};
    if (bytes.size() < 52U)
    {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < kMagic.size(); ++i)
    {
        if (std::to_integer<char>(bytes[i]) != kMagic[i])
        {
            return std::nullopt;
        }
    }

    const auto elf_class = std::to_integer<std::uint8_t>(bytes[4]);
    const auto elf_data  = std::to_integer<std::uint8_t>(bytes[5]);
    if ((elf_class != 1U && elf_class != 2U) || (elf_data != 1U && elf_data != 2U))
    {
        return std::nullopt;
    }
    const bool       wide = elf_class == 2U;
    const ByteReader reader{bytes, elf_data == 1U};

    // section headers first, they survive strip better than most people think
    const auto section_offset = reader.word(wide ? 40U : 32U, wide);
    const auto section_size   = reader.u16(wide ? 58U : 46U);
    const auto section_count  = reader.u16(wide ? 60U : 48U);
    if (section_offset && section_size && section_count && *section_offset != 0U)
    {
        for (std::uint64_t i = 0; i < *section_count; ++i)
        {
            const auto header = *section_offset + i * *section_size;
            const auto type   = reader.u32(header + 4U);
            const auto offset = reader.word(header + (wide ? 24U : 16U), wide);
            const auto size   = reader.word(header + (wide ? 32U : 20U), wide);
            if (!type || !offset || !size)
            {
                break;
            }
            if (*type != kElfNoteSection)
            {
                continue;
            }
            if (auto id = find_build_id(reader, *offset, *size))
            {
                return FormatInfo{"elf", {std::move(*id)}};
            }
        }
    }

    const auto program_offset = reader.word(wide ? 32U : 28U, wide);
    const auto program_size   = reader.u16(wide ? 54U : 42U);
    const auto program_count  = reader.u16(wide ? 56U : 44U);
    if (program_offset && program_size && program_count && *program_offset != 0U)
    {
        for (std::uint64_t i = 0; i < *program_count; ++i)
        {
            const auto header = *program_offset + i * *program_size;
            const auto type   = reader.u32(header);
            const auto offset = reader.word(header + (wide ? 8U : 4U), wide);
            const auto size   = reader.word(header + (wide ? 32U : 16U), wide);
            if (!type || !offset || !size)
            {
                break;
            }
            if (*type != kElfNoteSegment)
            {
                continue;
            }
            if (auto id = find_build_id(reader, *offset, *size))
            {
                return FormatInfo{"elf", {std::move(*id)}};
            }
        }
    }
    return std::nullopt;
}

auto identify_macho(std::span<const std::byte> bytes) -> std::optional<FormatInfo>
{
    const ByteReader head{bytes, true};
    const auto       magic = head.u32(0U);
    if (!magic)
    {
        return std::nullopt;
    }

    bool wide          = false;
    bool little_endian = true;
    switch (*magic)
    {
    case kMachMagic32:
        break;
    case kMachMagic64:
        wide = true;
        break;
    case kMachCigam32:
        little_endian = false;
        break;
    case kMachCigam64:
        wide          = true;
        little_endian = false;
        break;
    default:
        return std::nullopt;
    }

    const ByteReader reader{bytes, little_endian};
    const auto       command_count = reader.u32(16U);
    if (!command_count)
    {
        return std::nullopt;
    }

    auto cursor = static_cast<std::uint64_t>(wide ? 32U : 28U);
    for (std::uint32_t i = 0; i < *command_count; ++i)
    {
        const auto command = reader.u32(cursor);
        const auto size    = reader.u32(cursor + 4U);
        if (!command || !size || *size < 8U)
        {
            return std::nullopt;
        }
        if (*command == kMachUuidCommand && *size >= 24U)
        {
            const auto raw = reader.slice(cursor + 8U, 16U);
            if (!raw)
            {
                return std::nullopt;
            }
            return FormatInfo{"macho", {format_uuid(*raw)}};
        }
        cursor += *size;
    }
    return std::nullopt;
}

auto identify_breakpad(std::span<const std::byte> bytes) -> std::optional<FormatInfo>
{
    constexpr std::string_view kPrefix = "MODULE ";
    constexpr std::size_t      kMaxHeaderLine = 1024U;

    const auto limit = std::min(bytes.size(), kMaxHeaderLine);
    std::string line;
    line.reserve(limit);
    for (std::size_t i = 0; i < limit; ++i)
    {
        const auto c = std::to_integer<char>(bytes[i]);
        if (c == '\n' || c == '\r')
        {
            break;
        }
        line.push_back(c);
    }
    if (!line.starts_with(kPrefix))
    {
        return std::nullopt;
    }

    // MODULE <os> <arch> <id> <name...>
    std::vector<std::string> fields;
    std::size_t              pos = kPrefix.size();
    while (pos < line.size() && fields.size() < 3U)
    {
        while (pos < line.size() && is_space(line[pos]))
        {
            ++pos;
        }
        const auto start = pos;
        while (pos < line.size() && !is_space(line[pos]))
        {
            ++pos;
        }
        if (pos > start)
        {
            fields.emplace_back(line.substr(start, pos - start));
        }
    }
    if (fields.size() < 3U)
    {
        return std::nullopt;
    }
    return FormatInfo{"breakpad", {fields[2]}};
}

auto builtin_introspector() -> Introspector
{
    return [](std::span<const std::byte> bytes, std::string_view /*name*/) -> std::optional<FormatInfo>
    {
        if (auto elf = identify_elf(bytes))
        {
            return elf;
        }
        if (auto macho = identify_macho(bytes))
        {
            return macho;
        }
        return identify_breakpad(bytes);
    };
}

} // namespace ckw::collect
