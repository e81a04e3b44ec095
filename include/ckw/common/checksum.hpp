/**
 * @file checksum.hpp
 * @brief SHA-1 content addressing, the identity of every chunk and artifact
 *
 * this header is the checksum engine: a pure digest over any byte slice plus a
 * streaming accumulator for callers that want to hash as they go. chunk
 * identity, artifact identity, and the wire format all derive from the
 * 20-byte digest rendered as 40 lowercase hex characters.
 *
 * both entry points are safe to call from many threads at once on independent
 * buffers (each call owns its own OpenSSL digest context).
 *
 * example:
 * @code
 * const auto sum = ckw::digest(std::as_bytes(std::span{text}));
 * std::cout << sum.hex() << '\n';
 * @endcode
 */
#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ckw
{

/**
 * @brief 20-byte SHA-1 digest with value semantics
 */
struct Checksum
{
    static constexpr std::size_t kSize = 20U;

    std::array<std::uint8_t, kSize> bytes{};

    /**
     * @brief lowercase hex rendering (40 characters)
     */
    [[nodiscard]] auto hex() const -> std::string;

    /**
     * @brief parses 40 hex characters (either case), nullopt on anything else
     */
    [[nodiscard]] static auto from_hex(std::string_view text) -> std::optional<Checksum>;

    auto operator<=>(const Checksum &) const = default;
};

/**
 * @brief digest of an arbitrary byte slice (empty input is valid)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] bytes any slice, including empty
 * @return SHA-1 checksum of exactly those bytes
 */
[[nodiscard]] auto digest(std::span<const std::byte> bytes) -> Checksum;

/**
 * @brief incremental hashing for callers streaming data in pieces
 *
 * finishing is idempotent: the first call to finish() seals the digest and
 * later calls return the same value.
 */
class ChecksumAccumulator
{
public:
    ChecksumAccumulator();
    ~ChecksumAccumulator();

    ChecksumAccumulator(ChecksumAccumulator &&) noexcept;
    auto operator=(ChecksumAccumulator &&) noexcept -> ChecksumAccumulator &;
    ChecksumAccumulator(const ChecksumAccumulator &)                    = delete;
    auto operator=(const ChecksumAccumulator &) -> ChecksumAccumulator & = delete;

    void update(std::span<const std::byte> bytes);

    [[nodiscard]] auto finish() -> Checksum;

private:
    struct State;
    std::unique_ptr<State> state_;
};

} // namespace ckw

template <>
struct std::hash<ckw::Checksum>
{
    auto operator()(const ckw::Checksum &sum) const noexcept -> std::size_t
    {
        // SHA-1 output is already uniformly distributed, the first word is plenty
        std::size_t value = 0U;
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i)
        {
            value = (value << 8U) | sum.bytes[i];
        }
        return value;
    }
};
