/**
 * @file config_validation_test.cpp
 * @brief exhaustive config loader validation because parsing bugs are cringe uwu
 */
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ckw/config/config.hpp"
#include "support/config_builder.hpp"
#include "test_config.hpp"

using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{CKW_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto make_good_config() -> ckw::config::RunConfig
{
    const auto result = ckw::test_support::load_config();
    if (!result)
    {
        throw std::runtime_error("expected default builder to succeed");
    }
    return result.value();
}

} // namespace

TEST(ConfigValidation, ParsesGoldenConfigFromBuilder)
{
    const auto config = make_good_config();
    EXPECT_EQ(config.server.url, "https://symbols.example.test");
    EXPECT_EQ(config.server.org, "acme");
    EXPECT_EQ(config.server.project, "rocket");
    EXPECT_EQ(config.server.auth_token, "s3cret");
    EXPECT_EQ(config.server.request_timeout, std::chrono::seconds{30});
    ASSERT_EQ(config.sources.size(), 1U);
    EXPECT_EQ(config.sources.front().generic_string(), "build/symbols");
    EXPECT_THAT(config.filters.extensions, ElementsAre("debug", "sym"));
    EXPECT_THAT(config.filters.formats, ElementsAre("elf", "breakpad"));
    EXPECT_TRUE(config.filters.include_archives);
    EXPECT_EQ(config.filters.max_file_size, 1048576U);
    EXPECT_EQ(config.collect.dedup, ckw::config::DedupPolicy::FirstSeen);
    EXPECT_EQ(config.upload.concurrency, 4U);
    EXPECT_TRUE(config.upload.compression);
    EXPECT_EQ(config.upload.max_attempts, 3U);
    EXPECT_EQ(config.upload.backoff.initial, std::chrono::milliseconds{1000});
    EXPECT_EQ(config.upload.backoff.max, std::chrono::milliseconds{8000});
    EXPECT_DOUBLE_EQ(config.upload.backoff.multiplier, 2.0);
    EXPECT_TRUE(config.assembly.wait);
    EXPECT_EQ(config.assembly.poll_interval, std::chrono::milliseconds{500});
    EXPECT_EQ(config.assembly.max_wait, std::chrono::seconds{60});
    EXPECT_EQ(config.assembly.missing_chunk_rounds, 2U);
    EXPECT_FALSE(config.assembly.timeouts_are_failures);
    EXPECT_EQ(config.logging.level, ckw::log::Level::Warn);
}

TEST(ConfigValidation, OptionalSectionsFallBackToDefaults)
{
    ckw::test_support::ConfigBuilderOptions options;
    options.include_filters  = false;
    options.include_collect  = false;
    options.include_upload   = false;
    options.include_assembly = false;
    options.include_logging  = false;
    const auto parsed        = ckw::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const ckw::config::RunConfig defaults{};
    EXPECT_TRUE(parsed->filters.extensions.empty());
    EXPECT_EQ(parsed->upload.concurrency, defaults.upload.concurrency);
    EXPECT_EQ(parsed->upload.max_attempts, 5U);
    EXPECT_EQ(parsed->upload.backoff.initial, std::chrono::milliseconds{1000});
    EXPECT_EQ(parsed->upload.backoff.max, std::chrono::milliseconds{30000});
    EXPECT_TRUE(parsed->assembly.wait);
    EXPECT_EQ(parsed->assembly.missing_chunk_rounds, 2U);
    EXPECT_EQ(parsed->assembly.max_wait, std::chrono::seconds{300});
    EXPECT_EQ(parsed->logging.level, ckw::log::Level::Info);
}

TEST(ConfigValidation, AssemblyWaitCanBeSwitchedOff)
{
    ckw::test_support::ConfigBuilderOptions options;
    options.wait      = false;
    const auto parsed = ckw::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_FALSE(parsed->assembly.wait);
    EXPECT_EQ(parsed->assembly.max_wait, std::chrono::seconds{60});
}

TEST(ConfigValidation, LoadsConfigFromFixtureOnDisk)
{
    const auto yaml_path = test_data_path("chunkwave.yaml");
    const auto result    = ckw::config::load_config_from_file(yaml_path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->server.org, "acme");
    EXPECT_EQ(result->collect.dedup, ckw::config::DedupPolicy::Largest);
    EXPECT_EQ(result->sources.size(), 2U);
}

TEST(ConfigValidation, MissingFileIsConfigInvalid)
{
    const auto result = ckw::config::load_config_from_file(test_data_path("does-not-exist.yaml"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ckw::ErrorKind::ConfigInvalid);
}

TEST(ConfigValidation, AuthTokenFallsBackToEnvironment)
{
    ckw::test_support::ConfigBuilderOptions options;
    options.auth_token     = "";
    options.auth_token_env = "CKW_TEST_TOKEN";
    ::setenv("CKW_TEST_TOKEN", "from-env", 1);
    const auto parsed = ckw::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(ckw::config::resolve_auth_token(parsed->server), "from-env");
    ::unsetenv("CKW_TEST_TOKEN");
    EXPECT_TRUE(ckw::config::resolve_auth_token(parsed->server).empty());
}

struct InvalidConfigCase
{
    std::string                             name;
    ckw::test_support::ConfigBuilderOptions options;
    std::string                             expected_message_substring;
    std::vector<std::string>                expected_context;
    std::function<void(std::string &)>      mutate_yaml; ///< optional for bespoke tweaks
};

class ConfigInvalidTest : public ::testing::TestWithParam<InvalidConfigCase>
{};

TEST_P(ConfigInvalidTest, ReportsDetailedValidationErrors)
{
    auto yaml = ckw::test_support::make_config_yaml(GetParam().options);
    if (GetParam().mutate_yaml)
    {
        GetParam().mutate_yaml(yaml);
    }
    const auto result = ckw::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value()) << "expected failure for case: " << GetParam().name;
    EXPECT_EQ(result.error().kind, ckw::ErrorKind::ConfigInvalid);
    EXPECT_THAT(result.error().message, HasSubstr(GetParam().expected_message_substring));
    if (!GetParam().expected_context.empty())
    {
        EXPECT_THAT(result.error().context, ElementsAreArray(GetParam().expected_context));
    }
}

auto make_invalid_cases() -> std::vector<InvalidConfigCase>
{
    using ckw::test_support::ConfigBuilderOptions;

    std::vector<InvalidConfigCase> cases;

    {
        ConfigBuilderOptions opts{};
        opts.include_server = false;
        cases.push_back({"MissingServerSection", opts, "missing 'server' section", {"server"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.server_url = "ftp://symbols.example.test";
        cases.push_back(
            {"NonHttpServerUrl", opts, "server.url must start with http:// or https://", {"server", "url"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.timeout_s = 0U;
        cases.push_back({"ZeroTimeout", opts, "server.timeout_s must be >= 1", {"server", "timeout_s"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.include_sources = false;
        cases.push_back({"MissingSources", opts, "sources must be a non-empty sequence", {"sources"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.sources = {};
        cases.push_back({"EmptySources", opts, "sources must be a non-empty sequence", {"sources"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.formats = {"elf", "pe"};
        cases.push_back({"UnknownFormatFilter",
                         opts,
                         "filters.formats must be subset of {elf,macho,breakpad}",
                         {"filters", "formats", "[1]"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.max_file_size = 0U;
        cases.push_back(
            {"ZeroMaxFileSize", opts, "filters.max_file_size must be > 0", {"filters", "max_file_size"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.dedup = "newest";
        cases.push_back(
            {"UnknownDedupPolicy", opts, "collect.dedup must be first_seen or largest", {"collect", "dedup"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.concurrency = 0U;
        cases.push_back(
            {"ZeroConcurrency", opts, "upload.concurrency must be [1,64]", {"upload", "concurrency"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.concurrency = 65U;
        cases.push_back(
            {"ConcurrencyTooHigh", opts, "upload.concurrency must be [1,64]", {"upload", "concurrency"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.max_attempts = 0U;
        cases.push_back(
            {"ZeroMaxAttempts", opts, "upload.max_attempts must be [1,20]", {"upload", "max_attempts"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.backoff_initial_ms = 5000U;
        opts.backoff_max_ms     = 1000U;
        cases.push_back({"BackoffMaxBelowInitial",
                         opts,
                         "upload.backoff.max_ms must be >= initial_ms",
                         {"upload", "backoff", "max_ms"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.backoff_multiplier = 0.5;
        cases.push_back({"BackoffMultiplierBelowOne",
                         opts,
                         "upload.backoff.multiplier must be >= 1",
                         {"upload", "backoff", "multiplier"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.backoff_jitter = 1.5;
        cases.push_back(
            {"JitterOutOfRange", opts, "upload.backoff.jitter must be [0,1]", {"upload", "backoff", "jitter"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.backoff_quota_factor = 0.5;
        cases.push_back({"QuotaFactorBelowOne",
                         opts,
                         "upload.backoff.quota_factor must be >= 1",
                         {"upload", "backoff", "quota_factor"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.poll_interval_ms = 0U;
        cases.push_back({"ZeroPollInterval",
                         opts,
                         "assembly.poll_interval_ms must be >= 1",
                         {"assembly", "poll_interval_ms"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.missing_chunk_rounds = 6U;
        cases.push_back({"TooManyMissingChunkRounds",
                         opts,
                         "assembly.missing_chunk_rounds must be [1,5]",
                         {"assembly", "missing_chunk_rounds"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.log_level = "chatty";
        cases.push_back(
            {"UnknownLogLevel", opts, "logging.level must be debug|info|warn|error", {"logging", "level"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        cases.push_back({"NonBooleanCompression",
                         opts,
                         "",
                         {"upload", "compression"},
                         [](std::string &yaml) {
                             const auto token = std::string{"compression: true"};
                             const auto pos   = yaml.find(token);
                             if (pos != std::string::npos)
                             {
                                 yaml.replace(pos, token.size(), "compression: sometimes");
                             }
                         }});
    }

    return cases;
}

INSTANTIATE_TEST_SUITE_P(ExhaustiveInvalidConfigs, ConfigInvalidTest,
                         ::testing::ValuesIn(make_invalid_cases()),
                         [](const ::testing::TestParamInfo<InvalidConfigCase> &test_info) {
                             return test_info.param.name;
                         });
