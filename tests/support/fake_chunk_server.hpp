/**
 * @file fake_chunk_server.hpp
 * @brief scripted in-memory ChunkServer so pipeline suites never touch the network
 *
 * behaves like a well-mannered chunk server by default:
 * - uploads are decompressed, re-digested and stored by checksum
 * - assembly succeeds once every chunk is stored and the concatenation hashes
 *   to the artifact checksum, otherwise it answers not_found + missing list
 * - the oracle reports assembled artifacts and chunks it does not hold
 *
 * tests then bend it: queue upload failures, script per-artifact assembly
 * answers, or make a request fail forever. every call is recorded and the
 * whole thing is mutex-guarded because the engine hammers it from workers.
 */
#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "ckw/common/checksum.hpp"
#include "ckw/net/chunk_server.hpp"
#include "ckw/net/compression.hpp"

namespace ckw::test_support
{

[[nodiscard]] inline auto default_capabilities() -> net::ServerCapabilities
{
    net::ServerCapabilities caps{};
    caps.upload_url        = "https://symbols.example.test/api/0/organizations/acme/chunk-upload/";
    caps.max_chunk_size    = 8ULL << 20U;
    caps.max_chunk_count   = 64U;
    caps.max_request_bytes = 32ULL << 20U;
    caps.hash_algorithm    = "sha1";
    caps.compression       = {net::Compression::Gzip};
    caps.accept            = {"debug_files"};
    return caps;
}

[[nodiscard]] inline auto failure(ErrorKind kind, std::uint32_t status, std::string message = "injected failure")
    -> net::RequestFailure
{
    return net::RequestFailure{make_error(kind, std::move(message)), status, std::chrono::seconds{0}};
}

/**
 * @brief a transport-level timeout as the HTTP layer would report it
 */
[[nodiscard]] inline auto timeout_failure() -> net::RequestFailure
{
    return failure(ErrorKind::NetworkError, 0U, "operation timed out");
}

class FakeChunkServer final : public net::ChunkServer
{
public:
    struct UploadCall
    {
        net::Compression      compression{net::Compression::Uncompressed};
        std::vector<Checksum> checksums;
        std::size_t           wire_bytes{0U};
        bool                  accepted{false};
    };

    explicit FakeChunkServer(net::ServerCapabilities caps = default_capabilities()) : caps_{std::move(caps)}
    {
    }

    // -- scripting ---------------------------------------------------------

    void set_capabilities(net::ServerCapabilities caps)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        caps_ = std::move(caps);
    }

    void fail_capabilities(net::RequestFailure failure)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        capability_failure_ = std::move(failure);
    }

    void fail_queries(net::RequestFailure failure)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        query_failure_ = std::move(failure);
    }

    /// the next upload requests fail with these, in order
    void queue_upload_failures(std::vector<net::RequestFailure> failures)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &item : failures)
        {
            upload_failures_.push_back(std::move(item));
        }
    }

    /// every request carrying this chunk fails with `failure`
    void reject_chunk(const Checksum &checksum, net::RequestFailure failure)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rejected_chunks_.insert_or_assign(checksum, std::move(failure));
    }

    /// answers consumed before the default assembly behavior kicks in
    void script_assembly(const Checksum &artifact, std::vector<net::AssembleResponse> responses)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &queue = assembly_scripts_[artifact];
        for (auto &response : responses)
        {
            queue.push_back(std::move(response));
        }
    }

    /// scripted not_found answers stop erasing the chunks they name
    void keep_chunks_on_scripted_not_found()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        forget_on_not_found_ = false;
    }

    /// assembly requests for this artifact fail at the transport level
    void fail_assembly(const Checksum &artifact, net::RequestFailure failure)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        assembly_failures_.insert_or_assign(artifact, std::move(failure));
    }

    /// pretend a chunk was already stored by an earlier run
    void preload_chunk(const Checksum &checksum, std::vector<std::byte> bytes)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stored_.insert_or_assign(checksum, std::move(bytes));
    }

    // -- inspection --------------------------------------------------------

    [[nodiscard]] auto upload_calls() const -> std::vector<UploadCall>
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return upload_calls_;
    }

    [[nodiscard]] auto accepted_uploads() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0U;
        for (const auto &call : upload_calls_)
        {
            count += call.accepted ? 1U : 0U;
        }
        return count;
    }

    /// how many accepted requests carried this chunk
    [[nodiscard]] auto times_uploaded(const Checksum &checksum) const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0U;
        for (const auto &call : upload_calls_)
        {
            if (!call.accepted)
            {
                continue;
            }
            for (const auto &sent : call.checksums)
            {
                count += sent == checksum ? 1U : 0U;
            }
        }
        return count;
    }

    [[nodiscard]] auto assemble_calls(const Checksum &artifact) const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto found = assemble_calls_.find(artifact);
        return found == assemble_calls_.end() ? 0U : found->second;
    }

    [[nodiscard]] auto total_assemble_calls() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t count = 0U;
        for (const auto &[checksum, calls] : assemble_calls_)
        {
            count += calls;
        }
        return count;
    }

    [[nodiscard]] auto capability_calls() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return capability_calls_;
    }

    [[nodiscard]] auto query_calls() const -> std::size_t
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return query_calls_;
    }

    [[nodiscard]] auto holds(const Checksum &checksum) const -> bool
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stored_.contains(checksum);
    }

    [[nodiscard]] auto is_assembled(const Checksum &artifact) const -> bool
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return assembled_.contains(artifact);
    }

    // -- ChunkServer -------------------------------------------------------

    auto fetch_capabilities() -> net::RequestResult<net::ServerCapabilities> override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++capability_calls_;
        if (capability_failure_)
        {
            return std::unexpected(*capability_failure_);
        }
        return caps_;
    }

    auto query_known(const std::vector<net::AssembleRequest> &requests)
        -> net::RequestResult<net::KnownContent> override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++query_calls_;
        if (query_failure_)
        {
            return std::unexpected(*query_failure_);
        }
        net::KnownContent known{};
        for (const auto &request : requests)
        {
            if (assembled_.contains(request.checksum))
            {
                known.complete.insert(request.checksum);
                continue;
            }
            for (const auto &chunk : request.chunks)
            {
                if (!stored_.contains(chunk))
                {
                    known.missing.insert(chunk);
                }
            }
        }
        return known;
    }

    auto upload_batch(const net::BatchPayload &payload) -> net::RequestResult<void> override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        UploadCall call{};
        call.compression = payload.compression;
        for (const auto &[checksum, bytes] : payload.parts)
        {
            call.checksums.push_back(checksum);
            call.wire_bytes += bytes.size();
        }

        const auto reject = [&](net::RequestFailure failure) -> net::RequestResult<void>
        {
            upload_calls_.push_back(std::move(call));
            return std::unexpected(std::move(failure));
        };

        if (!upload_failures_.empty())
        {
            auto next = std::move(upload_failures_.front());
            upload_failures_.pop_front();
            return reject(std::move(next));
        }
        for (const auto &checksum : call.checksums)
        {
            const auto found = rejected_chunks_.find(checksum);
            if (found != rejected_chunks_.end())
            {
                return reject(found->second);
            }
        }

        std::vector<std::pair<Checksum, std::vector<std::byte>>> decoded;
        for (const auto &[checksum, bytes] : payload.parts)
        {
            std::vector<std::byte> plain = bytes;
            if (payload.compression == net::Compression::Gzip)
            {
                auto inflated = net::gzip_decompress(bytes);
                if (!inflated)
                {
                    return reject(failure(ErrorKind::ServerRejected, 400U, "bad gzip part"));
                }
                plain = std::move(*inflated);
            }
            if (digest(plain) != checksum)
            {
                return reject(failure(ErrorKind::ServerRejected, 400U, "part does not match its checksum"));
            }
            decoded.emplace_back(checksum, std::move(plain));
        }
        for (auto &[checksum, bytes] : decoded)
        {
            stored_.insert_or_assign(checksum, std::move(bytes));
        }
        call.accepted = true;
        upload_calls_.push_back(std::move(call));
        return {};
    }

    auto assemble(const net::AssembleRequest &request) -> net::RequestResult<net::AssembleResponse> override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++assemble_calls_[request.checksum];

        if (const auto failed = assembly_failures_.find(request.checksum); failed != assembly_failures_.end())
        {
            return std::unexpected(failed->second);
        }
        if (auto script = assembly_scripts_.find(request.checksum);
            script != assembly_scripts_.end() && !script->second.empty())
        {
            auto next = std::move(script->second.front());
            script->second.pop_front();
            if (next.state == net::RemoteState::NotFound && forget_on_not_found_)
            {
                // a scripted not_found means the server lost those chunks
                for (const auto &checksum : next.missing_chunks)
                {
                    stored_.erase(checksum);
                }
            }
            return next;
        }

        if (assembled_.contains(request.checksum))
        {
            return net::AssembleResponse{net::RemoteState::Ok, {}, {}};
        }

        net::AssembleResponse response{};
        ChecksumAccumulator   whole;
        for (const auto &chunk : request.chunks)
        {
            const auto found = stored_.find(chunk);
            if (found == stored_.end())
            {
                if (std::find(response.missing_chunks.begin(), response.missing_chunks.end(), chunk) ==
                    response.missing_chunks.end())
                {
                    response.missing_chunks.push_back(chunk);
                }
                continue;
            }
            whole.update(found->second);
        }
        if (!response.missing_chunks.empty())
        {
            response.state = net::RemoteState::NotFound;
            return response;
        }
        if (whole.finish() != request.checksum)
        {
            return net::AssembleResponse{net::RemoteState::Error, {}, "assembled checksum mismatch"};
        }
        assembled_.insert(request.checksum);
        return net::AssembleResponse{net::RemoteState::Ok, {}, {}};
    }

private:
    mutable std::mutex                                                    mutex_{};
    net::ServerCapabilities                                               caps_{};
    std::optional<net::RequestFailure>                                    capability_failure_{};
    std::optional<net::RequestFailure>                                    query_failure_{};
    std::deque<net::RequestFailure>                                       upload_failures_{};
    std::unordered_map<Checksum, net::RequestFailure>                     rejected_chunks_{};
    std::unordered_map<Checksum, std::deque<net::AssembleResponse>>       assembly_scripts_{};
    std::unordered_map<Checksum, net::RequestFailure>                     assembly_failures_{};
    std::unordered_map<Checksum, std::vector<std::byte>>                  stored_{};
    std::unordered_set<Checksum>                                          assembled_{};
    std::vector<UploadCall>                                               upload_calls_{};
    std::unordered_map<Checksum, std::size_t>                             assemble_calls_{};
    std::size_t                                                           capability_calls_{0U};
    std::size_t                                                           query_calls_{0U};
    bool                                                                  forget_on_not_found_{true};
};

} // namespace ckw::test_support
