/**
 * @file wire.cpp
 * @brief yaml-cpp backed JSON codecs and the multipart encoder
 */
#include "ckw/net/wire.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <charconv>
#include <format>
#include <system_error>
#include <utility>

namespace ckw::net::wire
{
namespace
{

[[nodiscard]] auto protocol_error(std::string message, std::vector<std::string> ctx) -> Error
{
    return Error{ErrorKind::ProtocolError, std::move(message), std::move(ctx)};
}

[[nodiscard]] auto load_document(std::string_view json, const char *what) -> std::expected<YAML::Node, Error>
{
    try
    {
        auto root = YAML::Load(std::string{json});
        if (!root.IsMap())
        {
            return std::unexpected(protocol_error("expected a JSON object", {what}));
        }
        return root;
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(protocol_error(ex.what(), {what}));
    }
}

template <typename T>
[[nodiscard]] auto read_field(const YAML::Node &parent, const char *key, T &out, bool required, const char *what)
    -> std::expected<void, Error>
{
    const auto node = parent[key];
    if (!node || node.IsNull())
    {
        if (required)
        {
            return std::unexpected(protocol_error(std::format("missing field '{}'", key), {what, key}));
        }
        return {};
    }
    try
    {
        out = node.as<T>();
    }
    catch (const YAML::Exception &ex)
    {
        return std::unexpected(protocol_error(ex.what(), {what, key}));
    }
    return {};
}

[[nodiscard]] auto read_checksums(const YAML::Node &node, const std::string &crumb, const char *what)
    -> std::expected<std::vector<Checksum>, Error>
{
    std::vector<Checksum> checksums;
    if (!node || node.IsNull())
    {
        return checksums;
    }
    if (!node.IsSequence())
    {
        return std::unexpected(protocol_error("expected a list of checksums", {what, crumb}));
    }
    checksums.reserve(node.size());
    for (const auto &item : node)
    {
        const auto parsed = item.IsScalar() ? Checksum::from_hex(item.Scalar()) : std::nullopt;
        if (!parsed)
        {
            return std::unexpected(protocol_error("malformed checksum in list", {what, crumb}));
        }
        checksums.push_back(*parsed);
    }
    return checksums;
}

void begin_json(YAML::Emitter &out)
{
    out.SetOutputCharset(YAML::EscapeAsJson);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
}

void emit_checksums(YAML::Emitter &out, const std::vector<Checksum> &checksums)
{
    out << YAML::BeginSeq;
    for (const auto &sum : checksums)
    {
        out << sum.hex();
    }
    out << YAML::EndSeq;
}

/**
 * @brief map keys sorted so encoded documents are byte-stable
 */
template <typename Map>
[[nodiscard]] auto sorted_keys(const Map &map) -> std::vector<Checksum>
{
    std::vector<Checksum> keys;
    keys.reserve(map.size());
    for (const auto &[key, value] : map)
    {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace

auto parse_capabilities(std::string_view json) -> std::expected<ServerCapabilities, Error>
{
    constexpr const char *kWhat = "capabilities";
    auto                  root  = load_document(json, kWhat);
    if (!root)
    {
        return std::unexpected(root.error());
    }

    ServerCapabilities caps{};
    std::uint64_t      max_wait = 0U;
    for (auto step : {read_field(*root, "url", caps.upload_url, true, kWhat),
                      read_field(*root, "chunkSize", caps.max_chunk_size, true, kWhat),
                      read_field(*root, "chunksPerRequest", caps.max_chunk_count, true, kWhat),
                      read_field(*root, "maxRequestSize", caps.max_request_bytes, true, kWhat),
                      read_field(*root, "maxFileSize", caps.max_file_size, false, kWhat),
                      read_field(*root, "maxWait", max_wait, false, kWhat),
                      read_field(*root, "concurrency", caps.concurrency, false, kWhat),
                      read_field(*root, "hashAlgorithm", caps.hash_algorithm, false, kWhat)})
    {
        if (!step)
        {
            return std::unexpected(step.error());
        }
    }
    caps.max_wait = std::chrono::seconds{static_cast<std::chrono::seconds::rep>(max_wait)};

    std::vector<std::string> modes;
    std::vector<std::string> accept;
    for (auto step : {read_field(*root, "compression", modes, false, kWhat),
                      read_field(*root, "accept", accept, false, kWhat)})
    {
        if (!step)
        {
            return std::unexpected(step.error());
        }
    }
    for (const auto &mode : modes)
    {
        // unknown modes (brotli, zstd, ...) are simply not ours to speak
        if (const auto parsed = parse_compression(mode);
            parsed && std::find(caps.compression.begin(), caps.compression.end(), *parsed) == caps.compression.end())
        {
            caps.compression.push_back(*parsed);
        }
    }
    caps.accept = std::move(accept);
    return caps;
}

auto encode_capabilities(const ServerCapabilities &caps) -> std::string
{
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << caps.upload_url;
    out << YAML::Key << "chunkSize" << YAML::Value << caps.max_chunk_size;
    out << YAML::Key << "chunksPerRequest" << YAML::Value << caps.max_chunk_count;
    out << YAML::Key << "maxRequestSize" << YAML::Value << caps.max_request_bytes;
    out << YAML::Key << "maxFileSize" << YAML::Value << caps.max_file_size;
    out << YAML::Key << "maxWait" << YAML::Value << static_cast<std::uint64_t>(caps.max_wait.count());
    out << YAML::Key << "concurrency" << YAML::Value << caps.concurrency;
    out << YAML::Key << "hashAlgorithm" << YAML::Value << caps.hash_algorithm;
    out << YAML::Key << "compression" << YAML::Value << YAML::BeginSeq;
    for (const auto mode : caps.compression)
    {
        out << std::string{to_string(mode)};
    }
    out << YAML::EndSeq;
    out << YAML::Key << "accept" << YAML::Value << caps.accept;
    out << YAML::EndMap;
    return out.c_str();
}

auto encode_assemble_requests(const std::vector<AssembleRequest> &requests) -> std::string
{
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    for (const auto &request : requests)
    {
        out << YAML::Key << request.checksum.hex() << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << request.name;
        if (request.debug_id)
        {
            out << YAML::Key << "debug_id" << YAML::Value << *request.debug_id;
        }
        out << YAML::Key << "chunks" << YAML::Value;
        emit_checksums(out, request.chunks);
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return out.c_str();
}

auto parse_assemble_requests(std::string_view json) -> std::expected<std::vector<AssembleRequest>, Error>
{
    constexpr const char *kWhat = "assemble_request";
    auto                  root  = load_document(json, kWhat);
    if (!root)
    {
        return std::unexpected(root.error());
    }

    std::vector<AssembleRequest> requests;
    for (const auto &item : *root)
    {
        const auto key      = item.first.as<std::string>("");
        const auto checksum = Checksum::from_hex(key);
        if (!checksum || !item.second.IsMap())
        {
            return std::unexpected(protocol_error("malformed assemble entry", {kWhat, key}));
        }
        AssembleRequest request;
        request.checksum = *checksum;
        std::string debug_id;
        for (auto step : {read_field(item.second, "name", request.name, true, kWhat),
                          read_field(item.second, "debug_id", debug_id, false, kWhat)})
        {
            if (!step)
            {
                return std::unexpected(with_context(step.error(), key));
            }
        }
        if (!debug_id.empty())
        {
            request.debug_id = std::move(debug_id);
        }
        auto chunks = read_checksums(item.second["chunks"], key, kWhat);
        if (!chunks)
        {
            return std::unexpected(chunks.error());
        }
        request.chunks = std::move(*chunks);
        requests.push_back(std::move(request));
    }
    return requests;
}

auto encode_assemble_responses(const AssembleResponses &responses) -> std::string
{
    YAML::Emitter out;
    begin_json(out);
    out << YAML::BeginMap;
    for (const auto &checksum : sorted_keys(responses))
    {
        const auto &response = responses.at(checksum);
        out << YAML::Key << checksum.hex() << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "state" << YAML::Value << std::string{to_string(response.state)};
        out << YAML::Key << "missingChunks" << YAML::Value;
        emit_checksums(out, response.missing_chunks);
        if (!response.detail.empty())
        {
            out << YAML::Key << "detail" << YAML::Value << response.detail;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return out.c_str();
}

auto parse_assemble_responses(std::string_view json) -> std::expected<AssembleResponses, Error>
{
    constexpr const char *kWhat = "assemble_response";
    auto                  root  = load_document(json, kWhat);
    if (!root)
    {
        return std::unexpected(root.error());
    }

    AssembleResponses responses;
    for (const auto &item : *root)
    {
        const auto key      = item.first.as<std::string>("");
        const auto checksum = Checksum::from_hex(key);
        if (!checksum || !item.second.IsMap())
        {
            return std::unexpected(protocol_error("malformed assemble response entry", {kWhat, key}));
        }

        std::string state;
        std::string detail;
        for (auto step : {read_field(item.second, "state", state, true, kWhat),
                          read_field(item.second, "detail", detail, false, kWhat)})
        {
            if (!step)
            {
                return std::unexpected(with_context(step.error(), key));
            }
        }
        const auto parsed_state = parse_remote_state(state);
        if (!parsed_state)
        {
            return std::unexpected(
                protocol_error(std::format("unknown assembly state '{}'", state), {kWhat, key}));
        }
        auto missing = read_checksums(item.second["missingChunks"], key, kWhat);
        if (!missing)
        {
            return std::unexpected(missing.error());
        }
        responses.emplace(*checksum, AssembleResponse{*parsed_state, std::move(*missing), std::move(detail)});
    }
    return responses;
}

auto encode_multipart(const BatchPayload &payload, std::string_view boundary) -> std::string
{
    const std::string_view part_name = payload.compression == Compression::Gzip ? "file_gzip" : "file";

    std::string body;
    for (const auto &[checksum, bytes] : payload.parts)
    {
        body.append("--").append(boundary).append("\r\n");
        body.append("Content-Disposition: form-data; name=\"").append(part_name);
        body.append("\"; filename=\"").append(checksum.hex()).append("\"\r\n");
        body.append("Content-Type: application/octet-stream\r\n\r\n");
        body.append(reinterpret_cast<const char *>(bytes.data()), bytes.size());
        body.append("\r\n");
    }
    body.append("--").append(boundary).append("--\r\n");
    return body;
}

auto multipart_content_type(std::string_view boundary) -> std::string
{
    return std::format("multipart/form-data; boundary={}", boundary);
}

auto classify_status(std::uint32_t status) noexcept -> std::optional<ErrorKind>
{
    if (status >= 200U && status < 300U)
    {
        return std::nullopt;
    }
    if (status == 401U || status == 403U)
    {
        return ErrorKind::AuthError;
    }
    if (status == 429U)
    {
        return ErrorKind::QuotaExceeded;
    }
    if (status == 408U || status >= 500U)
    {
        return ErrorKind::NetworkError;
    }
    if (status >= 400U)
    {
        return ErrorKind::ServerRejected;
    }
    return ErrorKind::ProtocolError;
}

auto parse_retry_after(std::string_view header) noexcept -> std::chrono::seconds
{
    while (!header.empty() && (header.front() == ' ' || header.front() == '\t'))
    {
        header.remove_prefix(1U);
    }
    while (!header.empty() && (header.back() == ' ' || header.back() == '\t' || header.back() == '\r' ||
                               header.back() == '\n'))
    {
        header.remove_suffix(1U);
    }
    long long  seconds = 0;
    const auto result  = std::from_chars(header.data(), header.data() + header.size(), seconds);
    if (result.ec != std::errc{} || result.ptr != header.data() + header.size() || seconds < 0)
    {
        return std::chrono::seconds{0};
    }
    return std::chrono::seconds{seconds};
}

} // namespace ckw::net::wire
