/**
 * @file log.hpp
 * @brief tiny tagged logger so worker threads can gossip without mangling lines
 *
 * every line looks like `[ckw::upload] WARN batch 3 retrying in 2000 ms` which
 * keeps grepping painless. output goes to stderr unless someone (usually a
 * test) points it somewhere else.
 *
 * ⚠️ IMPURE (shared process-wide sink guarded by a mutex)
 */
#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ckw::log
{

enum class Level : std::uint8_t
{
    Debug = 0U,
    Info  = 1U,
    Warn  = 2U,
    Error = 3U
};

/**
 * @brief parses "debug" / "info" / "warn" / "warning" / "error" (case-insensitive)
 */
[[nodiscard]] auto parse_level(std::string_view raw) -> std::optional<Level>;

[[nodiscard]] auto to_string(Level level) noexcept -> std::string_view;

/**
 * @brief sets the minimum level that reaches the sink
 */
void set_level(Level level);

[[nodiscard]] auto level() -> Level;

/**
 * @brief redirects output (the stream must outlive every later log call)
 */
void set_sink(std::ostream &sink);

/**
 * @brief restores std::cerr as the sink
 */
void reset_sink();

/**
 * @brief writes one line tagged with the component name
 *
 * @param[in] level severity, dropped when below the configured minimum
 * @param[in] component short tag such as "collect" or "assemble"
 * @param[in] message already-rendered message text
 */
void write(Level level, std::string_view component, std::string_view message);

inline void debug(std::string_view component, std::string_view message)
{
    write(Level::Debug, component, message);
}

inline void info(std::string_view component, std::string_view message)
{
    write(Level::Info, component, message);
}

inline void warn(std::string_view component, std::string_view message)
{
    write(Level::Warn, component, message);
}

inline void error(std::string_view component, std::string_view message)
{
    write(Level::Error, component, message);
}

} // namespace ckw::log
