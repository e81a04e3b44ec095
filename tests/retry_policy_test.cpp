/**
 * @file retry_policy_test.cpp
 * @brief backoff schedule, quota stretching and the retry loop on fake time
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stop_token>
#include <string>

#include "ckw/upload/retry_policy.hpp"
#include "support/fake_chunk_server.hpp"
#include "support/manual_clock.hpp"

using ckw::ErrorKind;
using ckw::upload::RetryPolicy;
using ckw::upload::run_with_retry;
using std::chrono::milliseconds;
using std::chrono::seconds;
using testing::ElementsAre;

namespace
{

[[nodiscard]] auto settings(std::uint32_t attempts = 4U, double jitter = 0.0) -> ckw::config::UploadSettings
{
    ckw::config::UploadSettings upload{};
    upload.max_attempts         = attempts;
    upload.backoff.initial      = milliseconds{1000};
    upload.backoff.max          = milliseconds{5000};
    upload.backoff.multiplier   = 2.0;
    upload.backoff.jitter       = jitter;
    upload.backoff.quota_factor = 3.0;
    return upload;
}

using IntResult = ckw::net::RequestResult<int>;

} // namespace

TEST(RetryPolicy, ExponentialScheduleIsCappedAtMax)
{
    const RetryPolicy policy{settings()};
    EXPECT_EQ(policy.delay_after(1U, ErrorKind::NetworkError), milliseconds{1000});
    EXPECT_EQ(policy.delay_after(2U, ErrorKind::NetworkError), milliseconds{2000});
    EXPECT_EQ(policy.delay_after(3U, ErrorKind::NetworkError), milliseconds{4000});
    EXPECT_EQ(policy.delay_after(4U, ErrorKind::NetworkError), milliseconds{5000});
    EXPECT_EQ(policy.delay_after(12U, ErrorKind::NetworkError), milliseconds{5000});
}

TEST(RetryPolicy, QuotaErrorsWaitLongerAndHonorRetryAfter)
{
    const RetryPolicy policy{settings()};
    EXPECT_EQ(policy.delay_after(1U, ErrorKind::QuotaExceeded), milliseconds{3000});
    EXPECT_EQ(policy.delay_after(1U, ErrorKind::QuotaExceeded, seconds{10}), milliseconds{10000});
    EXPECT_EQ(policy.delay_after(3U, ErrorKind::NetworkError, seconds{1}), milliseconds{4000});
}

TEST(RetryPolicy, JitterStaysInsideTheConfiguredFraction)
{
    const RetryPolicy low{settings(4U, 0.5), [] { return 0.0; }};
    const RetryPolicy high{settings(4U, 0.5), [] { return 1.0; }};
    EXPECT_EQ(low.delay_after(2U, ErrorKind::NetworkError), milliseconds{1000});
    EXPECT_EQ(high.delay_after(2U, ErrorKind::NetworkError), milliseconds{2000});
}

TEST(RetryPolicy, OnlyTransientErrorsAreRetried)
{
    const RetryPolicy policy{settings(3U)};
    EXPECT_TRUE(policy.should_retry(ckw::make_error(ErrorKind::NetworkError, "reset"), 1U));
    EXPECT_TRUE(policy.should_retry(ckw::make_error(ErrorKind::QuotaExceeded, "slow down"), 2U));
    EXPECT_FALSE(policy.should_retry(ckw::make_error(ErrorKind::NetworkError, "reset"), 3U));
    EXPECT_FALSE(policy.should_retry(ckw::make_error(ErrorKind::ServerRejected, "400"), 1U));
    EXPECT_FALSE(policy.should_retry(ckw::make_error(ErrorKind::AuthError, "401"), 1U));
}

TEST(RunWithRetry, SleepsOneThenTwoSecondsBeforeSucceeding)
{
    ckw::test_support::ManualClock clock;
    const RetryPolicy              policy{settings()};
    int                            calls = 0;
    std::uint32_t                  attempts{0U};

    const auto result = run_with_retry(
        policy, clock.timing(), std::stop_token{}, "upload batch 0",
        [&]() -> IntResult
        {
            ++calls;
            if (calls < 3)
            {
                return std::unexpected(ckw::test_support::timeout_failure());
            }
            return 42;
        },
        &attempts);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(attempts, 3U);
    EXPECT_THAT(clock.sleeps(), ElementsAre(milliseconds{1000}, milliseconds{2000}));
}

TEST(RunWithRetry, GivesUpAfterMaxAttempts)
{
    ckw::test_support::ManualClock clock;
    const RetryPolicy              policy{settings(2U)};
    int                            calls = 0;

    const auto result = run_with_retry(policy, clock.timing(), std::stop_token{}, "query",
                                       [&]() -> IntResult
                                       {
                                           ++calls;
                                           return std::unexpected(ckw::test_support::timeout_failure());
                                       });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, ErrorKind::NetworkError);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(clock.sleeps().size(), 1U);
}

TEST(RunWithRetry, PermanentFailuresReturnImmediately)
{
    ckw::test_support::ManualClock clock;
    const RetryPolicy              policy{settings()};
    int                            calls = 0;

    const auto result = run_with_retry(policy, clock.timing(), std::stop_token{}, "assemble",
                                       [&]() -> IntResult
                                       {
                                           ++calls;
                                           return std::unexpected(ckw::test_support::failure(
                                               ErrorKind::ServerRejected, 400U, "bad request"));
                                       });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST(RunWithRetry, StopRequestCancelsBeforeTheNextAttempt)
{
    ckw::test_support::ManualClock clock;
    const RetryPolicy              policy{settings()};
    std::stop_source               source;
    int                            calls = 0;

    const auto result = run_with_retry(policy, clock.timing(), source.get_token(), "upload",
                                       [&]() -> IntResult
                                       {
                                           ++calls;
                                           source.request_stop();
                                           return std::unexpected(ckw::test_support::timeout_failure());
                                       });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().error.kind, ErrorKind::Cancelled);
    EXPECT_EQ(calls, 1);
}
