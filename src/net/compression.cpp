/**
 * @file compression.cpp
 * @brief zlib deflate/inflate with the gzip wrapper (window bits 15 + 16)
 */
#include "ckw/net/compression.hpp"

#include <zlib.h>

#include <array>
#include <format>
#include <string>
#include <utility>

namespace ckw::net
{
namespace
{

constexpr int         kGzipWindowBits = MAX_WBITS + 16;
constexpr int         kMemoryLevel    = 8;
constexpr std::size_t kInflateStep    = 64U * 1024U;

[[nodiscard]] auto zlib_error(std::string message, int status) -> Error
{
    return make_error(ErrorKind::CompressionFailed, std::format("{} (zlib status {})", message, status));
}

} // namespace

auto gzip_compress(std::span<const std::byte> input) -> std::expected<std::vector<std::byte>, Error>
{
    z_stream stream{};
    auto     status =
        deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemoryLevel, Z_DEFAULT_STRATEGY);
    if (status != Z_OK)
    {
        return std::unexpected(zlib_error("deflateInit2 failed", status));
    }

    std::vector<std::byte> output(deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in   = reinterpret_cast<Bytef *>(const_cast<std::byte *>(input.data()));
    stream.avail_in  = static_cast<uInt>(input.size());
    stream.next_out  = reinterpret_cast<Bytef *>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    status = deflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    deflateEnd(&stream);
    if (status != Z_STREAM_END)
    {
        return std::unexpected(zlib_error("deflate did not finish", status));
    }
    output.resize(static_cast<std::size_t>(produced));
    return output;
}

auto gzip_decompress(std::span<const std::byte> input) -> std::expected<std::vector<std::byte>, Error>
{
    z_stream stream{};
    auto     status = inflateInit2(&stream, kGzipWindowBits);
    if (status != Z_OK)
    {
        return std::unexpected(zlib_error("inflateInit2 failed", status));
    }
    stream.next_in  = reinterpret_cast<Bytef *>(const_cast<std::byte *>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());

    std::vector<std::byte> output;
    do
    {
        const auto used = output.size();
        output.resize(used + kInflateStep);
        stream.next_out  = reinterpret_cast<Bytef *>(output.data() + used);
        stream.avail_out = static_cast<uInt>(kInflateStep);
        status           = inflate(&stream, Z_NO_FLUSH);
        output.resize(used + kInflateStep - stream.avail_out);
    } while (status == Z_OK);

    inflateEnd(&stream);
    if (status != Z_STREAM_END)
    {
        return std::unexpected(zlib_error("gzip stream corrupt", status));
    }
    return output;
}

} // namespace ckw::net
