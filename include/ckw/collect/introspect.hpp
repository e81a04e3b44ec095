/**
 * @file introspect.hpp
 * @brief format sniffing that turns raw bytes into (format, identifiers) pairs
 *
 * the collector never hard-codes a format. it calls an Introspector, which is
 * any callable mapping bytes (plus a display name for diagnostics) to an
 * optional FormatInfo. nullopt means "not something we upload" and the
 * candidate is silently skipped.
 *
 * the built-in introspector understands three debug-info containers:
 * - ELF: NT_GNU_BUILD_ID note (section headers first, program headers second)
 * - Mach-O (thin, 32/64-bit, either endianness): LC_UUID load command
 * - Breakpad text symbols: the `MODULE <os> <arch> <id> <name>` first line
 *
 * every parser is bounds-checked against the slice, a truncated or lying
 * header simply yields nullopt.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string_view>

#include "ckw/collect/artifact.hpp"

namespace ckw::collect
{

/**
 * @brief pluggable format recognizer
 */
using Introspector = std::function<std::optional<FormatInfo>(std::span<const std::byte> bytes, std::string_view name)>;

/**
 * @brief ELF build-id reader
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return format "elf" with the lowercase hex build id, or nullopt when the
 *         slice is not ELF or carries no GNU build-id note
 */
[[nodiscard]] auto identify_elf(std::span<const std::byte> bytes) -> std::optional<FormatInfo>;

/**
 * @brief Mach-O LC_UUID reader
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return format "macho" with the uuid rendered 8-4-4-4-12 lowercase
 */
[[nodiscard]] auto identify_macho(std::span<const std::byte> bytes) -> std::optional<FormatInfo>;

/**
 * @brief Breakpad symbol file reader
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return format "breakpad" with the module id exactly as written
 */
[[nodiscard]] auto identify_breakpad(std::span<const std::byte> bytes) -> std::optional<FormatInfo>;

/**
 * @brief tries ELF, Mach-O and Breakpad in that order
 */
[[nodiscard]] auto builtin_introspector() -> Introspector;

} // namespace ckw::collect
