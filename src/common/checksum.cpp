/**
 * @file checksum.cpp
 * @brief OpenSSL EVP backed SHA-1 for the checksum engine
 */
#include "ckw/common/checksum.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace ckw
{
namespace
{

constexpr std::string_view kHexDigits = "0123456789abcdef";

[[nodiscard]] auto hex_value(char c) noexcept -> int
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}

struct ContextDeleter
{
    void operator()(EVP_MD_CTX *ctx) const noexcept
    {
        EVP_MD_CTX_free(ctx);
    }
};

using ContextPtr = std::unique_ptr<EVP_MD_CTX, ContextDeleter>;

[[nodiscard]] auto make_context() -> ContextPtr
{
    ContextPtr ctx{EVP_MD_CTX_new()};
    // allocation failure inside OpenSSL is the only way this trips
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1)
    {
        throw std::runtime_error("unable to initialise SHA-1 digest context");
    }
    return ctx;
}

[[nodiscard]] auto seal(EVP_MD_CTX *ctx) -> Checksum
{
    Checksum sum{};
    unsigned int length = 0U;
    EVP_DigestFinal_ex(ctx, sum.bytes.data(), &length);
    return sum;
}

} // namespace

auto Checksum::hex() const -> std::string
{
    std::string out;
    out.reserve(kSize * 2U);
    for (const auto byte : bytes)
    {
        out.push_back(kHexDigits[byte >> 4U]);
        out.push_back(kHexDigits[byte & 0x0FU]);
    }
    return out;
}

auto Checksum::from_hex(std::string_view text) -> std::optional<Checksum>
{
    if (text.size() != kSize * 2U)
    {
        return std::nullopt;
    }
    Checksum sum{};
    for (std::size_t i = 0; i < kSize; ++i)
    {
        const auto hi = hex_value(text[2U * i]);
        const auto lo = hex_value(text[2U * i + 1U]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        sum.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return sum;
}

auto digest(std::span<const std::byte> bytes) -> Checksum
{
    auto ctx = make_context();
    if (!bytes.empty())
    {
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size());
    }
    return seal(ctx.get());
}

struct ChecksumAccumulator::State
{
    ContextPtr              ctx;
    std::optional<Checksum> sealed;
};

ChecksumAccumulator::ChecksumAccumulator() : state_{std::make_unique<State>(State{make_context(), std::nullopt})}
{
}

ChecksumAccumulator::~ChecksumAccumulator() = default;

ChecksumAccumulator::ChecksumAccumulator(ChecksumAccumulator &&) noexcept = default;

auto ChecksumAccumulator::operator=(ChecksumAccumulator &&) noexcept -> ChecksumAccumulator & = default;

void ChecksumAccumulator::update(std::span<const std::byte> bytes)
{
    if (state_->sealed || bytes.empty())
    {
        return;
    }
    EVP_DigestUpdate(state_->ctx.get(), bytes.data(), bytes.size());
}

auto ChecksumAccumulator::finish() -> Checksum
{
    if (!state_->sealed)
    {
        state_->sealed = seal(state_->ctx.get());
    }
    return *state_->sealed;
}

} // namespace ckw
