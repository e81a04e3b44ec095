/**
 * @file http_chunk_server.cpp
 * @brief libcurl easy-handle transport with status classification
 */
#include "ckw/net/http_chunk_server.hpp"

#include <curl/curl.h>

#include <cctype>
#include <format>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "ckw/common/log.hpp"
#include "ckw/net/wire.hpp"

namespace ckw::net
{
namespace
{

constexpr std::string_view kComponent     = "http";
constexpr std::size_t      kMaxBodyInError = 200U;

struct EasyDeleter
{
    void operator()(CURL *handle) const noexcept
    {
        curl_easy_cleanup(handle);
    }
};

struct HeaderListDeleter
{
    void operator()(curl_slist *list) const noexcept
    {
        curl_slist_free_all(list);
    }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

void ensure_global_init()
{
    static std::once_flag once;
    std::call_once(once,
                   []
                   {
                       if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                       {
                           throw std::runtime_error("curl_global_init failed");
                       }
                   });
}

auto collect_body(char *data, std::size_t size, std::size_t count, void *user) -> std::size_t
{
    auto *body = static_cast<std::string *>(user);
    body->append(data, size * count);
    return size * count;
}

auto collect_retry_after(char *data, std::size_t size, std::size_t count, void *user) -> std::size_t
{
    constexpr std::string_view kHeader = "retry-after:";
    const std::string_view     line{data, size * count};
    if (line.size() > kHeader.size())
    {
        bool matches = true;
        for (std::size_t i = 0; i < kHeader.size(); ++i)
        {
            if (std::tolower(static_cast<unsigned char>(line[i])) != kHeader[i])
            {
                matches = false;
                break;
            }
        }
        if (matches)
        {
            *static_cast<std::chrono::seconds *>(user) = wire::parse_retry_after(line.substr(kHeader.size()));
        }
    }
    return size * count;
}

[[nodiscard]] auto trim_trailing_slash(std::string url) -> std::string
{
    while (!url.empty() && url.back() == '/')
    {
        url.pop_back();
    }
    return url;
}

struct CurlStringDeleter
{
    void operator()(char *text) const noexcept
    {
        curl_free(text);
    }
};

/// percent-encodes one path segment so org / project slugs never split the route
[[nodiscard]] auto escape_segment(const std::string &segment) -> std::string
{
    ensure_global_init();
    const std::unique_ptr<char, CurlStringDeleter> escaped{
        curl_easy_escape(nullptr, segment.c_str(), static_cast<int>(segment.size()))};
    if (!escaped)
    {
        throw std::runtime_error("curl_easy_escape failed");
    }
    return std::string{escaped.get()};
}

[[nodiscard]] auto failure(ErrorKind kind, std::string message, std::string url, std::uint32_t status = 0U,
                           std::chrono::seconds retry_after = std::chrono::seconds{0}) -> RequestFailure
{
    return RequestFailure{make_error(kind, std::move(message), {std::move(url)}), status, retry_after};
}

} // namespace

auto capabilities_url(const HttpSettings &settings) -> std::string
{
    return std::format("{}/api/0/organizations/{}/chunk-upload/", settings.base_url, escape_segment(settings.org));
}

auto assemble_url(const HttpSettings &settings) -> std::string
{
    return std::format("{}/api/0/projects/{}/{}/files/difs/assemble/", settings.base_url,
                       escape_segment(settings.org), escape_segment(settings.project));
}

auto HttpSettings::from_config(const config::ServerSettings &server) -> HttpSettings
{
    HttpSettings settings;
    settings.base_url   = trim_trailing_slash(server.url);
    settings.org        = server.org;
    settings.project    = server.project;
    settings.auth_token = config::resolve_auth_token(server);
    settings.timeout    = server.request_timeout;
    return settings;
}

HttpChunkServer::HttpChunkServer(HttpSettings settings) : settings_{std::move(settings)}
{
    ensure_global_init();
    settings_.base_url = trim_trailing_slash(settings_.base_url);
}

auto HttpChunkServer::resolve(const std::string &url) const -> std::string
{
    if (url.starts_with("http://") || url.starts_with("https://"))
    {
        return url;
    }
    if (url.starts_with("/"))
    {
        return settings_.base_url + url;
    }
    return std::format("{}/{}", settings_.base_url, url);
}

auto HttpChunkServer::upload_url() const -> std::string
{
    const std::lock_guard lock{upload_url_mutex_};
    return upload_url_;
}

auto HttpChunkServer::perform(const std::string &url, const std::string *body, const std::string &content_type)
    -> RequestResult<Response>
{
    EasyHandle handle{curl_easy_init()};
    if (!handle)
    {
        return std::unexpected(failure(ErrorKind::NetworkError, "curl_easy_init failed", url));
    }

    HeaderList headers;
    const auto append_header = [&](const std::string &line)
    {
        if (auto *appended = curl_slist_append(headers.get(), line.c_str()); appended != nullptr)
        {
            static_cast<void>(headers.release());
            headers.reset(appended);
        }
    };
    if (!settings_.auth_token.empty())
    {
        append_header(std::format("Authorization: Bearer {}", settings_.auth_token));
    }
    if (body != nullptr)
    {
        append_header(std::format("Content-Type: {}", content_type));
    }
    append_header("Expect:");

    Response response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, settings_.user_agent.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout.count()));
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &collect_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERFUNCTION, &collect_retry_after);
    curl_easy_setopt(handle.get(), CURLOPT_HEADERDATA, &response.retry_after);
    if (body != nullptr)
    {
        curl_easy_setopt(handle.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(handle.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    }

    const auto code = curl_easy_perform(handle.get());
    if (code != CURLE_OK)
    {
        return std::unexpected(failure(ErrorKind::NetworkError, curl_easy_strerror(code), url));
    }

    long status = 0;
    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint32_t>(status);
    log::debug(kComponent, std::format("{} {} -> {}", body != nullptr ? "POST" : "GET", url, status));

    if (const auto kind = wire::classify_status(response.status))
    {
        auto excerpt = response.body.substr(0, kMaxBodyInError);
        auto message = excerpt.empty() ? std::format("HTTP {}", status) : std::format("HTTP {}: {}", status, excerpt);
        return std::unexpected(failure(*kind, std::move(message), url, response.status, response.retry_after));
    }
    return response;
}

auto HttpChunkServer::fetch_capabilities() -> RequestResult<ServerCapabilities>
{
    const auto url      = capabilities_url(settings_);
    auto       response = perform(url, nullptr, {});
    if (!response)
    {
        return std::unexpected(response.error());
    }
    auto caps = wire::parse_capabilities(response->body);
    if (!caps)
    {
        return std::unexpected(RequestFailure{caps.error(), response->status, std::chrono::seconds{0}});
    }
    {
        const std::lock_guard lock{upload_url_mutex_};
        upload_url_ = resolve(caps->upload_url);
    }
    return std::move(*caps);
}

auto HttpChunkServer::post_assemble(const std::vector<AssembleRequest> &requests)
    -> RequestResult<std::unordered_map<Checksum, AssembleResponse>>
{
    const auto url  = assemble_url(settings_);
    const auto body = wire::encode_assemble_requests(requests);
    auto       response = perform(url, &body, "application/json");
    if (!response)
    {
        return std::unexpected(response.error());
    }
    auto parsed = wire::parse_assemble_responses(response->body);
    if (!parsed)
    {
        return std::unexpected(RequestFailure{parsed.error(), response->status, std::chrono::seconds{0}});
    }
    return std::move(*parsed);
}

auto HttpChunkServer::query_known(const std::vector<AssembleRequest> &requests) -> RequestResult<KnownContent>
{
    KnownContent known;
    if (requests.empty())
    {
        return known;
    }
    auto responses = post_assemble(requests);
    if (!responses)
    {
        return std::unexpected(responses.error());
    }

    for (const auto &request : requests)
    {
        const auto found = responses->find(request.checksum);
        if (found == responses->end())
        {
            // no news is not good news, assume the server has nothing
            known.missing.insert(request.chunks.begin(), request.chunks.end());
            continue;
        }
        switch (found->second.state)
        {
        case RemoteState::Ok:
            known.complete.insert(request.checksum);
            break;
        case RemoteState::Created:
        case RemoteState::Assembling:
            break;
        case RemoteState::NotFound:
            if (found->second.missing_chunks.empty())
            {
                known.missing.insert(request.chunks.begin(), request.chunks.end());
            }
            else
            {
                known.missing.insert(found->second.missing_chunks.begin(), found->second.missing_chunks.end());
            }
            break;
        case RemoteState::Error:
            known.missing.insert(request.chunks.begin(), request.chunks.end());
            break;
        }
    }
    return known;
}

auto HttpChunkServer::upload_batch(const BatchPayload &payload) -> RequestResult<void>
{
    const auto url = upload_url();
    if (url.empty())
    {
        return std::unexpected(
            failure(ErrorKind::CapabilityFetchError, "upload url unknown, capabilities were never fetched", "upload"));
    }

    ChecksumAccumulator boundary_seed;
    for (const auto &[checksum, bytes] : payload.parts)
    {
        boundary_seed.update(std::as_bytes(std::span{checksum.bytes}));
    }
    const auto boundary = std::format("ckw-boundary-{}", boundary_seed.finish().hex());
    const auto body     = wire::encode_multipart(payload, boundary);

    auto response = perform(url, &body, wire::multipart_content_type(boundary));
    if (!response)
    {
        return std::unexpected(response.error());
    }
    return {};
}

auto HttpChunkServer::assemble(const AssembleRequest &request) -> RequestResult<AssembleResponse>
{
    auto responses = post_assemble({request});
    if (!responses)
    {
        return std::unexpected(responses.error());
    }
    const auto found = responses->find(request.checksum);
    if (found == responses->end())
    {
        return std::unexpected(RequestFailure{
            make_error(ErrorKind::ProtocolError, "assemble response omitted the artifact", {request.name}), 200U,
            std::chrono::seconds{0}});
    }
    return found->second;
}

} // namespace ckw::net
