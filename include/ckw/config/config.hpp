/**
 * @file config.hpp
 * @brief YAML-powered run config loader that absolutely slaps uwu
 *
 * this header defines the run configuration for a ChunkWave upload. it parses
 * YAML 1.2 documents into strongly typed C++ structs, validates them
 * aggressively, and bubbles up ergonomic errors via std::expected. the rest of
 * the engine consumes these values as already-validated knobs, nothing
 * downstream re-checks ranges.
 *
 * sections: server routing, artifact sources, discovery filters, dedup policy,
 * upload knobs (concurrency, compression, retry/backoff), assembly polling,
 * and logging. everything except `server` and `sources` has defaults.
 *
 * @note yaml-cpp 0.7+ powers parsing but we stay dependency-light elsewhere
 *
 * example (basic usage):
 * @code
 * auto config_result = ckw::config::load_config_from_file("chunkwave.yaml");
 * if (!config_result) {
 *     std::cerr << "config error: " << ckw::describe(config_result.error()) << '\n';
 *     return EXIT_FAILURE;
 * }
 * const auto& config = *config_result;
 * // config.sources now lists the roots to walk uwu
 * @endcode
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "ckw/common/error.hpp"
#include "ckw/common/log.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace ckw::config
{

/**
 * @brief which file represents a set of candidates sharing an identifier
 */
enum class DedupPolicy : std::uint8_t
{
    FirstSeen = 0U, ///< first candidate in deterministic walk order wins
    Largest   = 1U  ///< largest byte length wins, walk order breaks ties
};

/**
 * @brief where the chunk server lives and who we are to it
 */
struct ServerSettings
{
    std::string               url;            ///< base URL, http:// or https://
    std::string               org;            ///< organization slug for routing
    std::string               project;        ///< project slug for routing
    std::string               auth_token;     ///< literal bearer token (may be empty)
    std::string               auth_token_env; ///< env var consulted when auth_token is empty
    std::chrono::seconds      request_timeout{60}; ///< per-request transport timeout
};

/**
 * @brief discovery filters applied before introspection results are accepted
 */
struct FilterSettings
{
    std::vector<std::string> extensions;       ///< allow-list without dots, empty = everything
    std::vector<std::string> path_globs;       ///< fnmatch allow-list, empty = everything
    std::vector<std::string> formats;          ///< format tags (elf, macho, breakpad), empty = all
    std::vector<std::string> ids;              ///< identifier allow-list, empty = all
    bool                     include_archives{true}; ///< descend into zip files found while walking
    std::uint64_t            max_file_size{2ULL * 1024ULL * 1024ULL * 1024ULL}; ///< skip anything larger
};

struct CollectSettings
{
    DedupPolicy dedup{DedupPolicy::FirstSeen};
};

/**
 * @brief exponential backoff knobs (delay = initial * multiplier^(attempt-1))
 */
struct BackoffSettings
{
    std::chrono::milliseconds initial{1000};
    std::chrono::milliseconds max{30000};
    double                    multiplier{2.0};   ///< >= 1
    double                    jitter{0.0};       ///< fraction of the delay randomized, [0, 1]
    double                    quota_factor{2.0}; ///< extra multiplier for rate limiting, >= 1
};

struct UploadSettings
{
    std::uint32_t   concurrency{8U};  ///< max in-flight requests (1..64)
    bool            compression{true}; ///< allow gzip when the server supports it
    std::uint32_t   max_attempts{5U}; ///< total attempts per request (1..20)
    BackoffSettings backoff{};
};

struct AssemblySettings
{
    bool                      wait{true}; ///< poll until terminal; false requests assembly once and reports Pending
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::seconds      max_wait{300};
    std::uint32_t             missing_chunk_rounds{2U}; ///< re-upload rounds before giving up (1..5)
    bool                      timeouts_are_failures{false};
};

struct LoggingSettings
{
    log::Level level{log::Level::Info};
};

/**
 * @brief main configuration object bundling all run inputs
 */
struct RunConfig
{
    ServerSettings                     server;
    std::vector<std::filesystem::path> sources;
    FilterSettings                     filters;
    CollectSettings                    collect;
    UploadSettings                     upload;
    AssemblySettings                   assembly;
    LoggingSettings                    logging;
};

using ConfigResult = std::expected<RunConfig, Error>;

/**
 * @brief parses YAML config from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * this helper is impure because:
 * - hits the file system to read YAML
 * - may throw yaml-cpp exceptions internally (captured into expected)
 *
 * @param[in] path filesystem location of YAML document
 * @return ConfigResult containing RunConfig or a ConfigInvalid error
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief parses YAML config directly from a string buffer (test-friendly)
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief low-level parser for already-loaded YAML nodes
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

/**
 * @brief resolves the bearer token (literal first, then the env var)
 *
 * ⚠️ IMPURE FUNCTION (reads the process environment)
 */
[[nodiscard]] auto resolve_auth_token(const ServerSettings &server) -> std::string;

} // namespace ckw::config
