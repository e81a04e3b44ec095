/**
 * @file chunker_test.cpp
 * @brief chunk boundaries, shared chunks across artifacts and re-read repair
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "ckw/chunk/chunker.hpp"
#include "support/temp_dir.hpp"

using ckw::Artifact;
using ckw::chunk::ChunkLimits;
using ckw::chunk::ChunkStore;
using ckw::test_support::patterned_bytes;
using testing::ElementsAre;

namespace
{

constexpr ChunkLimits kLimits{1024U, 8U, 0U};

[[nodiscard]] auto make_artifact(ckw::ArtifactId id, std::vector<std::byte> bytes) -> Artifact
{
    Artifact artifact;
    artifact.id    = id;
    artifact.name  = "artifact-" + std::to_string(id);
    artifact.size  = bytes.size();
    artifact.bytes = std::make_shared<const std::vector<std::byte>>(std::move(bytes));
    return artifact;
}

} // namespace

TEST(Chunker, RequiredChunksRoundsUp)
{
    EXPECT_EQ(ckw::chunk::required_chunks(0U, 1024U), 1U);
    EXPECT_EQ(ckw::chunk::required_chunks(1U, 1024U), 1U);
    EXPECT_EQ(ckw::chunk::required_chunks(1024U, 1024U), 1U);
    EXPECT_EQ(ckw::chunk::required_chunks(1025U, 1024U), 2U);
    EXPECT_EQ(kLimits.file_cap(), 8192U);
    EXPECT_EQ((ChunkLimits{1024U, 8U, 4000U}.file_cap()), 4000U);
}

TEST(Chunker, FileCapSaturatesInsteadOfWrapping)
{
    constexpr auto kHuge = std::uint64_t{1} << 40U;
    EXPECT_EQ((ChunkLimits{kHuge, kHuge, 0U}.file_cap()), std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ((ChunkLimits{std::numeric_limits<std::uint64_t>::max(), 2U, 0U}.file_cap()),
              std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ((ChunkLimits{kHuge, 1U << 20U, 0U}.file_cap()), std::uint64_t{1} << 60U);
    EXPECT_EQ((ChunkLimits{0U, kHuge, 0U}.file_cap()), 0U);
}

TEST(Chunker, SingleChunkSharesTheArtifactChecksum)
{
    ChunkStore store;
    auto       artifact = make_artifact(0U, patterned_bytes(700U, 1U));
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());

    ASSERT_EQ(artifact.chunks.size(), 1U);
    EXPECT_EQ(artifact.chunks.front(), artifact.checksum);
    EXPECT_EQ(artifact.checksum, ckw::digest(*artifact.bytes));
    EXPECT_EQ(artifact.stage, ckw::ArtifactStage::Chunked);
}

TEST(Chunker, MultiChunkBoundariesAndWholeChecksum)
{
    ChunkStore store;
    const auto bytes    = patterned_bytes(2500U, 2U);
    auto       artifact = make_artifact(0U, bytes);
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());

    ASSERT_EQ(artifact.chunks.size(), 3U);
    const std::span<const std::byte> all{bytes};
    EXPECT_EQ(artifact.chunks[0], ckw::digest(all.subspan(0, 1024)));
    EXPECT_EQ(artifact.chunks[1], ckw::digest(all.subspan(1024, 1024)));
    EXPECT_EQ(artifact.chunks[2], ckw::digest(all.subspan(2048)));
    EXPECT_EQ(artifact.checksum, ckw::digest(all));

    const auto tail = store.find(artifact.chunks[2]);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->offset, 2048U);
    EXPECT_EQ(tail->length, 452U);
    EXPECT_TRUE(ckw::chunk::verify(*tail));
    EXPECT_EQ(store.total_bytes(), 2500U);
}

TEST(Chunker, EmptyArtifactIsOneEmptyChunk)
{
    ChunkStore store;
    auto       artifact = make_artifact(0U, {});
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());
    ASSERT_EQ(artifact.chunks.size(), 1U);
    EXPECT_EQ(artifact.chunks.front().hex(), "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST(Chunker, OversizedArtifactIsRejected)
{
    ChunkStore store;
    auto       artifact = make_artifact(0U, patterned_bytes(kLimits.file_cap() + 1U, 3U));
    const auto chunked  = ckw::chunk::chunk_artifact(artifact, kLimits, store);
    ASSERT_FALSE(chunked.has_value());
    EXPECT_EQ(chunked.error().kind, ckw::ErrorKind::ArtifactTooLarge);
    EXPECT_EQ(store.size(), 0U);
    EXPECT_TRUE(artifact.chunks.empty());
}

TEST(Chunker, IdenticalContentSharesChunksAcrossArtifacts)
{
    ChunkStore            store;
    std::vector<Artifact> artifacts;
    artifacts.push_back(make_artifact(0U, patterned_bytes(3000U, 4U)));
    artifacts.push_back(make_artifact(1U, patterned_bytes(3000U, 4U)));
    artifacts.push_back(make_artifact(2U, patterned_bytes(kLimits.file_cap() * 2U, 5U)));

    const auto failures = ckw::chunk::chunk_artifacts(artifacts, kLimits, store, 3U);
    ASSERT_EQ(failures.size(), 1U);
    EXPECT_EQ(failures.front().id, 2U);

    EXPECT_EQ(artifacts[0].chunks, artifacts[1].chunks);
    EXPECT_EQ(store.size(), 3U);
    for (const auto &checksum : artifacts[0].chunks)
    {
        EXPECT_THAT(store.owners(checksum), ElementsAre(0U, 1U));
    }
}

TEST(Chunker, RepairRebindsAfterASuccessfulReRead)
{
    ChunkStore store;
    const auto original = patterned_bytes(2048U, 6U);
    auto       artifact = make_artifact(0U, original);
    artifact.reload     = [original]() -> std::expected<std::vector<std::byte>, ckw::Error> { return original; };
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());

    const auto second = artifact.chunks[1];
    ASSERT_TRUE(ckw::chunk::repair(second, artifact, kLimits, store).has_value());
    const auto rebound = store.find(second);
    ASSERT_TRUE(rebound.has_value());
    EXPECT_NE(rebound->buffer, artifact.bytes);
    EXPECT_TRUE(ckw::chunk::verify(*rebound));
}

TEST(Chunker, RepairFailsWhenTheSourceChanged)
{
    ChunkStore store;
    auto       artifact = make_artifact(0U, patterned_bytes(2048U, 7U));
    artifact.reload     = []() -> std::expected<std::vector<std::byte>, ckw::Error> { return patterned_bytes(2048U, 8U); };
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());

    const auto repaired = ckw::chunk::repair(artifact.chunks[0], artifact, kLimits, store);
    ASSERT_FALSE(repaired.has_value());
    EXPECT_EQ(repaired.error().kind, ckw::ErrorKind::ChecksumMismatch);
}

TEST(Chunker, RepairRefusesForeignChunks)
{
    ChunkStore store;
    auto       artifact = make_artifact(0U, patterned_bytes(100U, 9U));
    ASSERT_TRUE(ckw::chunk::chunk_artifact(artifact, kLimits, store).has_value());
    const auto repaired = ckw::chunk::repair(ckw::digest(patterned_bytes(5U, 1U)), artifact, kLimits, store);
    ASSERT_FALSE(repaired.has_value());
    EXPECT_EQ(repaired.error().kind, ckw::ErrorKind::ChecksumMismatch);
}
