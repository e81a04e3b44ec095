/**
 * @file chunk_server.cpp
 * @brief remote state names shared by every ChunkServer backend
 */
#include "ckw/net/chunk_server.hpp"

namespace ckw::net
{

auto to_string(RemoteState state) noexcept -> std::string_view
{
    switch (state)
    {
    case RemoteState::Ok:
        return "ok";
    case RemoteState::Created:
        return "created";
    case RemoteState::Assembling:
        return "assembling";
    case RemoteState::NotFound:
        return "not_found";
    case RemoteState::Error:
        return "error";
    }
    return "error";
}

auto parse_remote_state(std::string_view raw) -> std::optional<RemoteState>
{
    if (raw == "ok")
    {
        return RemoteState::Ok;
    }
    if (raw == "created")
    {
        return RemoteState::Created;
    }
    if (raw == "assembling")
    {
        return RemoteState::Assembling;
    }
    if (raw == "not_found")
    {
        return RemoteState::NotFound;
    }
    if (raw == "error")
    {
        return RemoteState::Error;
    }
    return std::nullopt;
}

} // namespace ckw::net
