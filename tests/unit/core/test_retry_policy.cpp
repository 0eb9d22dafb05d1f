/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry_policy
 */

#include <gtest/gtest.h>

#include <kcenon/upload_orchestrator/core/retry_policy.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

namespace kcenon::upload_orchestrator::test {

using namespace std::chrono_literals;

class RetryPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        config_.max_retries = 2;
        config_.base_delay = 1ms;
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    retry_config config_;
    cancellation_source source_;
};

TEST_F(RetryPolicyTest, DefaultConfig) {
    retry_config config;
    EXPECT_EQ(config.max_retries, 2u);
    EXPECT_EQ(config.base_delay, 1000ms);
    EXPECT_EQ(config.max_attempts(), 3u);
    EXPECT_TRUE(config.validate());
}

TEST_F(RetryPolicyTest, LinearBackoff) {
    retry_config config;
    config.base_delay = 1000ms;
    retry_policy policy(config);

    EXPECT_EQ(policy.delay_for(1), 1000ms);
    EXPECT_EQ(policy.delay_for(2), 2000ms);
    EXPECT_EQ(policy.delay_for(3), 3000ms);
}

TEST_F(RetryPolicyTest, SuccessOnFirstAttempt) {
    retry_policy policy(config_);
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<int> {
            ++calls;
            return 7;
        },
        source_.get_token());

    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 7);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, TransientErrorIsRetriedUntilSuccess) {
    retry_policy policy(config_);
    std::vector<uint32_t> attempts;
    std::vector<uint32_t> retries;

    auto r = policy.execute(
        [&](uint32_t attempt) -> result<int> {
            attempts.push_back(attempt);
            if (attempt < 3) {
                return unexpected(error{error_code::server_error, "503"});
            }
            return 1;
        },
        source_.get_token(),
        [&](uint32_t next, const error& cause) {
            retries.push_back(next);
            EXPECT_EQ(cause.code, error_code::server_error);
        });

    ASSERT_TRUE(r);
    EXPECT_EQ(attempts, (std::vector<uint32_t>{1, 2, 3}));
    EXPECT_EQ(retries, (std::vector<uint32_t>{2, 3}));
}

TEST_F(RetryPolicyTest, NeverExceedsMaxAttempts) {
    retry_policy policy(config_);
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return unexpected(error{error_code::network_error, "connection reset"});
        },
        source_.get_token());

    ASSERT_FALSE(r);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(r.error().code, error_code::network_error);
    EXPECT_EQ(r.error().message, "connection reset");
}

TEST_F(RetryPolicyTest, ZeroRetriesMeansOneAttempt) {
    config_.max_retries = 0;
    retry_policy policy(config_);
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return unexpected(error{error_code::network_error});
        },
        source_.get_token());

    EXPECT_FALSE(r);
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryPolicyTest, PermanentErrorIsNotRetried) {
    retry_policy policy(config_);
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return unexpected(error{error_code::request_rejected, "413 payload too large"});
        },
        source_.get_token());

    ASSERT_FALSE(r);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(r.error().code, error_code::request_rejected);
}

TEST_F(RetryPolicyTest, CancellationErrorShortCircuits) {
    retry_policy policy(config_);
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return unexpected(error{error_code::operation_cancelled});
        },
        source_.get_token());

    ASSERT_FALSE(r);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(r.error().code, error_code::operation_cancelled);
}

TEST_F(RetryPolicyTest, CancelledTokenPreventsFirstAttempt) {
    retry_policy policy(config_);
    source_.request_cancellation();
    int calls = 0;

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return {};
        },
        source_.get_token());

    ASSERT_FALSE(r);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(r.error().code, error_code::operation_cancelled);
}

TEST_F(RetryPolicyTest, FailureAfterCancelReportsCancelled) {
    retry_policy policy(config_);

    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            source_.request_cancellation();
            return unexpected(error{error_code::network_error, "aborted"});
        },
        source_.get_token());

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::operation_cancelled);
}

TEST_F(RetryPolicyTest, CancellationInterruptsBackoff) {
    config_.base_delay = 10s;
    retry_policy policy(config_);
    int calls = 0;

    std::thread canceller([this] {
        std::this_thread::sleep_for(50ms);
        source_.request_cancellation();
    });

    auto start = std::chrono::steady_clock::now();
    auto r = policy.execute(
        [&](uint32_t) -> result<void> {
            ++calls;
            return unexpected(error{error_code::service_unavailable});
        },
        source_.get_token());
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::operation_cancelled);
    EXPECT_EQ(calls, 1);
    EXPECT_LT(elapsed, 5s);
}

}  // namespace kcenon::upload_orchestrator::test
