/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, task ids, session snapshots)
 */

#include <gtest/gtest.h>

#include <kcenon/upload_orchestrator/core/session_types.h>
#include <kcenon/upload_orchestrator/core/task_id.h>
#include <kcenon/upload_orchestrator/core/types.h>

#include <string>
#include <unordered_set>

namespace kcenon::upload_orchestrator::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Transient: -900 to -909
    EXPECT_EQ(static_cast<int>(error_code::network_error), -900);
    EXPECT_EQ(static_cast<int>(error_code::rate_limited), -904);

    // Cancellation: -910
    EXPECT_EQ(static_cast<int>(error_code::operation_cancelled), -910);

    // Permanent: -920 to -929
    EXPECT_EQ(static_cast<int>(error_code::validation_failed), -920);
    EXPECT_EQ(static_cast<int>(error_code::retries_exhausted), -925);

    // Coordination: -930 to -939
    EXPECT_EQ(static_cast<int>(error_code::job_submit_failed), -930);
    EXPECT_EQ(static_cast<int>(error_code::invalid_job_status), -933);

    // Configuration and state: -940 to -959
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -940);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -950);
}

TEST_F(ErrorCodeTest, Categories) {
    EXPECT_EQ(category_of(error_code::success), error_category::none);
    EXPECT_EQ(category_of(error_code::network_error), error_category::transient);
    EXPECT_EQ(category_of(error_code::server_error), error_category::transient);
    EXPECT_EQ(category_of(error_code::operation_cancelled), error_category::cancellation);
    EXPECT_EQ(category_of(error_code::request_rejected), error_category::permanent);
    EXPECT_EQ(category_of(error_code::job_poll_failed), error_category::coordination);
    EXPECT_EQ(category_of(error_code::session_active), error_category::configuration);
}

TEST_F(ErrorCodeTest, OnlyTransientErrorsAreRetryable) {
    EXPECT_TRUE(is_retryable(error_code::network_error));
    EXPECT_TRUE(is_retryable(error_code::service_unavailable));
    EXPECT_TRUE(is_retryable(error_code::request_timeout));

    EXPECT_FALSE(is_retryable(error_code::operation_cancelled));
    EXPECT_FALSE(is_retryable(error_code::validation_failed));
    EXPECT_FALSE(is_retryable(error_code::request_rejected));
    EXPECT_FALSE(is_retryable(error_code::job_poll_failed));
}

TEST_F(ErrorCodeTest, CancellationDetection) {
    EXPECT_TRUE(is_cancellation(error_code::operation_cancelled));
    EXPECT_FALSE(is_cancellation(error_code::network_error));
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::network_error), "network error");
    EXPECT_STREQ(to_string(error_code::session_active), "upload session already active");
    EXPECT_STREQ(to_string(error_category::transient), "transient");
}

// =============================================================================
// result Tests
// =============================================================================

TEST(ResultTest, ValueAndError) {
    result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    result<int> failed = unexpected(error{error_code::file_not_found, "missing.pdf"});
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, error_code::file_not_found);
    EXPECT_EQ(failed.error().message, "missing.pdf");
    EXPECT_EQ(failed.error().category(), error_category::permanent);
}

TEST(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::no_active_session});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "no active upload session");
}

// =============================================================================
// task_id Tests
// =============================================================================

TEST(TaskIdTest, GeneratedIdsAreUniqueVersion4) {
    std::unordered_set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        auto id = task_id::generate();
        EXPECT_FALSE(id.is_null());

        auto text = id.to_string();
        ASSERT_EQ(text.size(), 36u);
        EXPECT_EQ(text[14], '4');
        EXPECT_TRUE(seen.insert(text).second);
    }
}

TEST(TaskIdTest, ParseRoundTrip) {
    auto id = task_id::generate();
    auto parsed = task_id::from_string(id.to_string());

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);
}

TEST(TaskIdTest, ParseRejectsMalformed) {
    EXPECT_FALSE(task_id::from_string("").has_value());
    EXPECT_FALSE(task_id::from_string("not-a-uuid").has_value());
    EXPECT_FALSE(task_id::from_string("123e4567-e89b-12d3-a456-42661417400g").has_value());
}

TEST(TaskIdTest, DefaultIsNull) {
    task_id id;
    EXPECT_TRUE(id.is_null());
}

// =============================================================================
// transfer_session Tests
// =============================================================================

class TransferSessionTest : public ::testing::Test {
protected:
    static auto make_task(std::string id, task_status status) -> file_task {
        file_task t;
        t.id = std::move(id);
        t.name = t.id + ".pdf";
        t.size = 100;
        t.status = status;
        return t;
    }
};

TEST_F(TransferSessionTest, CountsAndPercentages) {
    transfer_session s;
    s.total = 10;
    s.completed = 3;
    s.failed = 1;
    s.cancelled = 2;
    s.total_bytes = 1000;
    s.uploaded_bytes = 250;

    EXPECT_EQ(s.processed(), 6u);
    EXPECT_EQ(s.remaining(), 4u);
    EXPECT_DOUBLE_EQ(s.completion_percentage(), 40.0);
    EXPECT_DOUBLE_EQ(s.byte_percentage(), 25.0);
}

TEST_F(TransferSessionTest, EmptySessionPercentages) {
    transfer_session s;
    EXPECT_DOUBLE_EQ(s.completion_percentage(), 0.0);
    EXPECT_DOUBLE_EQ(s.byte_percentage(), 0.0);
    EXPECT_EQ(s.summary(), "");
}

TEST_F(TransferSessionTest, FindAndFilter) {
    transfer_session s;
    s.files = {make_task("a", task_status::completed), make_task("b", task_status::failed),
               make_task("c", task_status::failed), make_task("d", task_status::pending)};

    ASSERT_NE(s.find("b"), nullptr);
    EXPECT_EQ(s.find("b")->status, task_status::failed);
    EXPECT_EQ(s.find("zzz"), nullptr);
    EXPECT_EQ(s.failed_tasks().size(), 2u);
    EXPECT_EQ(s.count(task_status::pending), 1u);
}

TEST_F(TransferSessionTest, Summaries) {
    transfer_session s;
    s.total = 10;

    s.status = session_status::uploading;
    s.completed = 2;
    s.failed = 1;
    EXPECT_EQ(s.summary(), "Uploading 3/10...");

    s.status = session_status::paused;
    EXPECT_EQ(s.summary(), "Paused - 2 completed, 7 remaining");

    s.status = session_status::cancelling;
    EXPECT_EQ(s.summary(), "Cancelling...");

    s.status = session_status::complete;
    s.completed = 8;
    s.failed = 2;
    EXPECT_EQ(s.summary(), "Done: 8 uploaded, 2 failed");

    s.completed = 4;
    s.failed = 0;
    s.cancelled = 6;
    EXPECT_EQ(s.summary(), "Cancelled - 4 uploaded before cancellation");

    s.completed = 10;
    s.cancelled = 0;
    EXPECT_EQ(s.summary(), "All 10 files uploaded successfully");
}

TEST_F(TransferSessionTest, AllSucceeded) {
    transfer_session s;
    s.total = 2;
    s.completed = 2;
    s.status = session_status::uploading;
    EXPECT_FALSE(s.all_succeeded());

    s.status = session_status::complete;
    EXPECT_TRUE(s.all_succeeded());

    s.completed = 1;
    s.failed = 1;
    EXPECT_FALSE(s.all_succeeded());
}

TEST(FormatBytesTest, Units) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512.0 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(50ULL * 1024 * 1024), "50.0 MB");
}

TEST(TaskStatusTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(task_status::pending));
    EXPECT_FALSE(is_terminal(task_status::uploading));
    EXPECT_TRUE(is_terminal(task_status::completed));
    EXPECT_TRUE(is_terminal(task_status::failed));
    EXPECT_TRUE(is_terminal(task_status::cancelled));
}

}  // namespace kcenon::upload_orchestrator::test
