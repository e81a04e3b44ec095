/**
 * @file log.cpp
 * @brief implementation of the tagged logger uwu
 */
#include "ckw/common/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace ckw::log
{
namespace
{

constexpr std::string_view kPrefix = "[ckw::";

struct Sink
{
    std::mutex         mutex;
    std::ostream      *stream{&std::cerr};
    std::atomic<Level> min_level{Level::Info};
};

[[nodiscard]] auto sink() -> Sink &
{
    static Sink instance{};
    return instance;
}

} // namespace

auto parse_level(std::string_view raw) -> std::optional<Level>
{
    std::string normalized(raw);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (normalized == "debug")
    {
        return Level::Debug;
    }
    if (normalized == "info")
    {
        return Level::Info;
    }
    if (normalized == "warn" || normalized == "warning")
    {
        return Level::Warn;
    }
    if (normalized == "error")
    {
        return Level::Error;
    }
    return std::nullopt;
}

auto to_string(Level level) noexcept -> std::string_view
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

void set_level(Level level)
{
    sink().min_level.store(level);
}

auto level() -> Level
{
    return sink().min_level.load();
}

void set_sink(std::ostream &stream)
{
    auto &s = sink();
    const std::lock_guard lock(s.mutex);
    s.stream = &stream;
}

void reset_sink()
{
    set_sink(std::cerr);
}

void write(Level level, std::string_view component, std::string_view message)
{
    auto &s = sink();
    if (static_cast<std::uint8_t>(level) < static_cast<std::uint8_t>(s.min_level.load()))
    {
        return;
    }
    const std::lock_guard lock(s.mutex);
    (*s.stream) << kPrefix << component << "] " << to_string(level) << ' ' << message << '\n';
}

} // namespace ckw::log
