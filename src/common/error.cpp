/**
 * @file error.cpp
 * @brief error helpers (tiny but load bearing)
 */
#include "ckw/common/error.hpp"

#include <format>
#include <utility>

namespace ckw
{

auto make_error(ErrorKind kind, std::string message, std::initializer_list<std::string> ctx) -> Error
{
    Error err{};
    err.kind    = kind;
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

auto with_context(Error error, std::string crumb) -> Error
{
    error.context.insert(error.context.begin(), std::move(crumb));
    return error;
}

auto to_string(ErrorKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
    case ErrorKind::NetworkError:
        return "network_error";
    case ErrorKind::ServerRejected:
        return "server_rejected";
    case ErrorKind::QuotaExceeded:
        return "quota_exceeded";
    case ErrorKind::ArtifactTooLarge:
        return "artifact_too_large";
    case ErrorKind::PersistentlyMissingChunks:
        return "persistently_missing_chunks";
    case ErrorKind::AssemblyTimeout:
        return "assembly_timeout";
    case ErrorKind::ChecksumMismatch:
        return "checksum_mismatch";
    case ErrorKind::AuthError:
        return "auth_error";
    case ErrorKind::CapabilityFetchError:
        return "capability_fetch_error";
    case ErrorKind::ConfigInvalid:
        return "config_invalid";
    case ErrorKind::IoError:
        return "io_error";
    case ErrorKind::CompressionFailed:
        return "compression_failed";
    case ErrorKind::ProtocolError:
        return "protocol_error";
    case ErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

auto describe(const Error &error) -> std::string
{
    auto line = std::format("{}: {}", to_string(error.kind), error.message);
    if (!error.context.empty())
    {
        line += " (at ";
        for (std::size_t i = 0; i < error.context.size(); ++i)
        {
            if (i > 0U)
            {
                line += " > ";
            }
            line += error.context[i];
        }
        line += ')';
    }
    return line;
}

} // namespace ckw
