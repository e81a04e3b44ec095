/**
 * @file error.hpp
 * @brief one error payload to rule every module (std::expected all the way down uwu)
 *
 * every fallible ChunkWave operation returns std::expected<T, ckw::Error>.
 * the payload mirrors the config loader's breadcrumb style: a kind for
 * programmatic decisions (retry? abort the run? isolate to one artifact?), a
 * human-readable message, and a context trail so logs point at the exact
 * artifact / chunk / config key that went sideways.
 *
 * @note nothing here throws, yaml-cpp exceptions get mapped at the call site
 */
#pragma once

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace ckw
{

/**
 * @brief error taxonomy shared by the whole upload engine
 *
 * the first block is the run/transfer taxonomy, the second block covers the
 * ambient plumbing (config, io, codecs) that the engine also needs to report.
 */
enum class ErrorKind : std::uint8_t
{
    NetworkError,              ///< transport failure or 5xx, retryable
    ServerRejected,            ///< 4xx / malformed request, fatal for the batch or artifact
    QuotaExceeded,             ///< 429 rate limiting, retryable with longer backoff
    ArtifactTooLarge,          ///< artifact cannot be expressed under server limits
    PersistentlyMissingChunks, ///< server kept asking for chunks after bounded re-uploads
    AssemblyTimeout,           ///< soft failure, polling exceeded the max wait
    ChecksumMismatch,          ///< local bytes no longer hash to the recorded checksum
    AuthError,                 ///< 401/403, fatal to the run during capability fetch
    CapabilityFetchError,      ///< server capabilities unusable, fatal to the run
    ConfigInvalid,             ///< run configuration failed validation
    IoError,                   ///< local file system trouble
    CompressionFailed,         ///< zlib refused to cooperate
    ProtocolError,             ///< server response could not be decoded
    Cancelled                  ///< run-level abort signal observed
};

/**
 * @brief error payload with context breadcrumbs
 */
struct Error
{
    ErrorKind                kind{ErrorKind::IoError}; ///< classification used for policy decisions
    std::string              message;                  ///< spicy human-readable error message
    std::vector<std::string> context;                  ///< breadcrumb trail, outermost first
};

/**
 * @brief convenience constructor so call sites stay one-liners
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto make_error(ErrorKind kind, std::string message, std::initializer_list<std::string> ctx = {})
    -> Error;

/**
 * @brief prepends a breadcrumb and returns the same error (for bubbling up)
 */
[[nodiscard]] auto with_context(Error error, std::string crumb) -> Error;

/**
 * @brief stable lowercase name for logs and summaries (e.g. "artifact_too_large")
 */
[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/**
 * @brief whether the retry policy may try the same request again
 */
[[nodiscard]] constexpr auto is_retryable(ErrorKind kind) noexcept -> bool
{
    return kind == ErrorKind::NetworkError || kind == ErrorKind::QuotaExceeded;
}

/**
 * @brief whether the error aborts the entire run before any chunk work
 */
[[nodiscard]] constexpr auto is_fatal_to_run(ErrorKind kind) noexcept -> bool
{
    return kind == ErrorKind::AuthError || kind == ErrorKind::CapabilityFetchError ||
           kind == ErrorKind::ConfigInvalid;
}

/**
 * @brief renders message plus breadcrumbs as a single log-friendly line
 */
[[nodiscard]] auto describe(const Error &error) -> std::string;

} // namespace ckw
