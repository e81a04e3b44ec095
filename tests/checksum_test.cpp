/**
 * @file checksum_test.cpp
 * @brief SHA-1 content addressing sanity checks
 */
#include <gtest/gtest.h>
#include <string>
#include <unordered_set>

#include "ckw/common/checksum.hpp"
#include "support/temp_dir.hpp"

using ckw::Checksum;
using ckw::test_support::as_bytes;
using ckw::test_support::patterned_bytes;

TEST(Checksum, EmptyInputMatchesKnownDigest)
{
    EXPECT_EQ(ckw::digest({}).hex(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(Checksum, AbcMatchesKnownDigest)
{
    EXPECT_EQ(ckw::digest(as_bytes("abc")).hex(), "a9993e364706816aba3e25717850c26c9cd0d89d");
}

TEST(Checksum, AccumulatorMatchesOneShotDigest)
{
    const auto bytes = patterned_bytes(100000U, 7U);
    ckw::ChecksumAccumulator acc;
    const std::span<const std::byte> view{bytes};
    acc.update(view.subspan(0, 1));
    acc.update(view.subspan(1, 65535));
    acc.update(view.subspan(65536));
    EXPECT_EQ(acc.finish(), ckw::digest(bytes));
}

TEST(Checksum, HexRoundTripAcceptsUppercase)
{
    const auto parsed = Checksum::from_hex("A9993E364706816ABA3E25717850C26C9CD0D89D");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, ckw::digest(as_bytes("abc")));
}

TEST(Checksum, RejectsMalformedHex)
{
    EXPECT_FALSE(Checksum::from_hex("").has_value());
    EXPECT_FALSE(Checksum::from_hex("a9993e36").has_value());
    EXPECT_FALSE(Checksum::from_hex("z9993e364706816aba3e25717850c26c9cd0d89d").has_value());
    EXPECT_FALSE(Checksum::from_hex("a9993e364706816aba3e25717850c26c9cd0d89d00").has_value());
}

TEST(Checksum, IdenticalContentHashesIdentically)
{
    std::unordered_set<Checksum> seen;
    seen.insert(ckw::digest(patterned_bytes(4096U, 1U)));
    seen.insert(ckw::digest(patterned_bytes(4096U, 1U)));
    seen.insert(ckw::digest(patterned_bytes(4096U, 2U)));
    EXPECT_EQ(seen.size(), 2U);
}
