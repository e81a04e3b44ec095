/**
 * @file collector_test.cpp
 * @brief source walking, filters, archive descent and dedup policies
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "ckw/collect/collector.hpp"
#include "ckw/collect/introspect.hpp"
#include "support/temp_dir.hpp"
#include "support/zip_builder.hpp"

using ckw::collect::collect_artifacts;
using ckw::config::DedupPolicy;
using ckw::config::FilterSettings;
using ckw::test_support::as_bytes;
using ckw::test_support::make_zip;
using ckw::test_support::TempDir;
using testing::ElementsAre;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto breakpad(const std::string &id, const std::string &module, std::size_t padding = 0U) -> std::string
{
    return "MODULE Linux x86_64 " + id + " " + module + "\n" + std::string(padding, '#');
}

[[nodiscard]] auto names_of(const ckw::collect::CollectionResult &result) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (const auto &artifact : result.artifacts)
    {
        names.push_back(artifact.name);
    }
    return names;
}

} // namespace

TEST(Collector, WalksDirectoriesInSortedOrder)
{
    TempDir dir;
    dir.write("zeta/z.sym", breakpad("ZZ01", "z"));
    dir.write("alpha/b.sym", breakpad("BB01", "b"));
    dir.write("alpha/a.sym", breakpad("AA01", "a"));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen,
                                          ckw::collect::builtin_introspector());
    EXPECT_THAT(names_of(result), ElementsAre((dir.path() / "alpha/a.sym").string(),
                                              (dir.path() / "alpha/b.sym").string(),
                                              (dir.path() / "zeta/z.sym").string()));
    for (std::size_t i = 0; i < result.artifacts.size(); ++i)
    {
        EXPECT_EQ(result.artifacts[i].id, i);
        EXPECT_EQ(result.artifacts[i].format.format, "breakpad");
        ASSERT_NE(result.artifacts[i].bytes, nullptr);
        EXPECT_EQ(result.artifacts[i].size, result.artifacts[i].bytes->size());
    }
    EXPECT_EQ(result.candidates_seen, 3U);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(Collector, UnrecognizedFilesAreCountedNotReported)
{
    TempDir dir;
    dir.write("readme.txt", std::string_view{"hello"});
    dir.write("good.sym", breakpad("AA01", "good"));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen,
                                          ckw::collect::builtin_introspector());
    EXPECT_EQ(result.artifacts.size(), 1U);
    EXPECT_EQ(result.unrecognized, 1U);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(Collector, ExtensionAndGlobFilters)
{
    FilterSettings filters;
    filters.extensions = {"SYM"};
    EXPECT_TRUE(ckw::collect::passes_path_filters("a/b/libfoo.sym", filters));
    EXPECT_FALSE(ckw::collect::passes_path_filters("a/b/libfoo.debug", filters));
    EXPECT_FALSE(ckw::collect::passes_path_filters("noext", filters));

    filters.extensions.clear();
    filters.path_globs = {"release/*", "lib*.so.sym"};
    EXPECT_TRUE(ckw::collect::passes_path_filters("release/app.sym", filters));
    EXPECT_TRUE(ckw::collect::passes_path_filters("deep/tree/libssl.so.sym", filters));
    EXPECT_FALSE(ckw::collect::passes_path_filters("debug/app.sym", filters));
}

TEST(Collector, FormatAndIdentifierFilters)
{
    TempDir dir;
    dir.write("a.sym", breakpad("AA01", "a"));
    dir.write("b.sym", breakpad("BB01", "b"));

    FilterSettings only_elf;
    only_elf.formats = {"elf"};
    EXPECT_TRUE(collect_artifacts({dir.path()}, only_elf, DedupPolicy::FirstSeen, ckw::collect::builtin_introspector())
                    .artifacts.empty());

    FilterSettings by_id;
    by_id.ids = {"bb01"};
    const auto result =
        collect_artifacts({dir.path()}, by_id, DedupPolicy::FirstSeen, ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    EXPECT_THAT(result.artifacts.front().format.identifiers, ElementsAre("BB01"));
    EXPECT_EQ(result.unrecognized, 1U);
}

TEST(Collector, OversizedFilesBecomeDiagnostics)
{
    TempDir dir;
    dir.write("huge.sym", breakpad("AA01", "huge", 4096U));
    dir.write("small.sym", breakpad("BB01", "small"));

    FilterSettings filters;
    filters.max_file_size = 1024U;
    const auto result =
        collect_artifacts({dir.path()}, filters, DedupPolicy::FirstSeen, ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    ASSERT_EQ(result.diagnostics.size(), 1U);
    EXPECT_EQ(result.diagnostics.front().error.kind, ckw::ErrorKind::ArtifactTooLarge);
    EXPECT_THAT(result.diagnostics.front().location, HasSubstr("huge.sym"));
}

TEST(Collector, MissingSourceIsADiagnosticAndTheWalkContinues)
{
    TempDir dir;
    dir.write("ok.sym", breakpad("AA01", "ok"));

    const auto result = collect_artifacts({dir.path() / "nope", dir.path()}, FilterSettings{},
                                          DedupPolicy::FirstSeen, ckw::collect::builtin_introspector());
    EXPECT_EQ(result.artifacts.size(), 1U);
    ASSERT_EQ(result.diagnostics.size(), 1U);
    EXPECT_EQ(result.diagnostics.front().error.kind, ckw::ErrorKind::IoError);
}

TEST(Collector, DescendsIntoArchivesWithBangNames)
{
    TempDir dir;
    dir.write("bundle.zip", make_zip({{"inner/", {}},
                                      {"inner/a.sym", as_bytes(breakpad("AA01", "a")), true},
                                      {"inner/notes.txt", as_bytes("nope")}}));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen,
                                          ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    const auto &artifact = result.artifacts.front();
    EXPECT_EQ(artifact.name, (dir.path() / "bundle.zip").string() + "!inner/a.sym");
    EXPECT_EQ(artifact.archive_entry, "inner/a.sym");

    const auto reloaded = artifact.reload();
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error().message;
    EXPECT_EQ(*reloaded, *artifact.bytes);
}

TEST(Collector, ArchivesAreSkippedWhenDescentIsDisabled)
{
    TempDir dir;
    dir.write("bundle.zip", make_zip({{"a.sym", as_bytes(breakpad("AA01", "a"))}}));

    FilterSettings filters;
    filters.include_archives = false;
    const auto result =
        collect_artifacts({dir.path()}, filters, DedupPolicy::FirstSeen, ckw::collect::builtin_introspector());
    EXPECT_TRUE(result.artifacts.empty());
}

TEST(Collector, CorruptArchiveEntryIsReportedAndSiblingsSurvive)
{
    TempDir                           dir;
    ckw::test_support::ZipSpec        broken{"bad.sym", as_bytes(breakpad("AA01", "bad"))};
    broken.corrupt_crc = true;
    dir.write("bundle.zip", make_zip({broken, {"good.sym", as_bytes(breakpad("BB01", "good"))}}));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen,
                                          ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    EXPECT_THAT(result.artifacts.front().name, HasSubstr("!good.sym"));
    ASSERT_EQ(result.diagnostics.size(), 1U);
    EXPECT_THAT(result.diagnostics.front().location, HasSubstr("!bad.sym"));
}

TEST(Collector, FirstSeenDedupKeepsEarliestAndRecordsAliases)
{
    TempDir dir;
    dir.write("a/lib.sym", breakpad("AA01", "lib"));
    dir.write("b/lib.sym", breakpad("aa01", "lib", 100U));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen,
                                          ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    EXPECT_EQ(result.artifacts.front().name, (dir.path() / "a/lib.sym").string());
    EXPECT_THAT(result.artifacts.front().aliases, ElementsAre((dir.path() / "b/lib.sym").string()));
    EXPECT_EQ(result.duplicates, 1U);
}

TEST(Collector, LargestDedupPrefersBiggerCopy)
{
    TempDir dir;
    dir.write("a/lib.sym", breakpad("AA01", "lib"));
    dir.write("b/lib.sym", breakpad("AA01", "lib", 100U));

    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::Largest,
                                          ckw::collect::builtin_introspector());
    ASSERT_EQ(result.artifacts.size(), 1U);
    EXPECT_EQ(result.artifacts.front().name, (dir.path() / "b/lib.sym").string());
    EXPECT_THAT(result.artifacts.front().aliases, ElementsAre((dir.path() / "a/lib.sym").string()));
}

TEST(Collector, ArtifactsWithoutIdentifiersAreNeverCollapsed)
{
    TempDir dir;
    dir.write("one.blob", std::string_view{"same bytes"});
    dir.write("two.blob", std::string_view{"same bytes"});

    const ckw::collect::Introspector anonymous = [](std::span<const std::byte>, std::string_view) {
        return std::optional<ckw::FormatInfo>{ckw::FormatInfo{"blob", {}}};
    };
    const auto result = collect_artifacts({dir.path()}, FilterSettings{}, DedupPolicy::FirstSeen, anonymous);
    EXPECT_EQ(result.artifacts.size(), 2U);
    EXPECT_EQ(result.duplicates, 0U);
}
