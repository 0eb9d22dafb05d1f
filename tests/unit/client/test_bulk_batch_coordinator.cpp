/**
 * @file test_bulk_batch_coordinator.cpp
 * @brief Unit tests for bulk_batch_coordinator
 */

#include <gtest/gtest.h>

#include <kcenon/upload_orchestrator/client/bulk_batch_coordinator.h>

#include "integration/test_fixtures.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace kcenon::upload_orchestrator::test {

namespace {

auto make_batch(const std::vector<std::string>& names) -> std::vector<bulk_task> {
    std::vector<bulk_task> batch;
    for (std::size_t i = 0; i < names.size(); ++i) {
        batch.push_back({"t" + std::to_string(i), make_file(names[i], 100)});
    }
    return batch;
}

auto make_status(job_state state, std::size_t successes, std::vector<std::string> errors = {})
    -> job_status {
    job_status s;
    s.status = state;
    s.success_count = successes;
    s.error_count = errors.size();
    s.errors = std::move(errors);
    return s;
}

}  // namespace

// =============================================================================
// Batch partitioning
// =============================================================================

TEST(BulkBatchPartitionTest, SplitsIntoConsecutiveBatches) {
    auto batches = bulk_batch_coordinator::make_batches(45, 20);
    ASSERT_EQ(batches.size(), 3u);
    EXPECT_EQ(batches[0].begin, 0u);
    EXPECT_EQ(batches[0].size(), 20u);
    EXPECT_EQ(batches[1].begin, 20u);
    EXPECT_EQ(batches[1].size(), 20u);
    EXPECT_EQ(batches[2].begin, 40u);
    EXPECT_EQ(batches[2].end, 45u);
    EXPECT_EQ(batches[2].size(), 5u);
}

TEST(BulkBatchPartitionTest, EdgeSizes) {
    EXPECT_TRUE(bulk_batch_coordinator::make_batches(0, 20).empty());
    EXPECT_TRUE(bulk_batch_coordinator::make_batches(10, 0).empty());
    EXPECT_EQ(bulk_batch_coordinator::make_batches(20, 20).size(), 1u);
    EXPECT_EQ(bulk_batch_coordinator::make_batches(21, 20).size(), 2u);
    EXPECT_EQ(bulk_batch_coordinator::make_batches(3, 1).size(), 3u);
}

// =============================================================================
// Reconciliation
// =============================================================================

TEST(BulkReconcileTest, NamedErrorsFailAndSuccessesCompleteInOrder) {
    auto batch = make_batch({"a.pdf", "b.pdf", "c.pdf", "d.pdf"});
    auto status = make_status(job_state::completed_with_errors, 3, {"b.pdf: corrupt"});

    auto out = bulk_batch_coordinator::reconcile(batch, status);

    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].status, task_status::completed);
    EXPECT_EQ(out[1].status, task_status::failed);
    EXPECT_EQ(out[1].error.value(), "corrupt");
    EXPECT_EQ(out[2].status, task_status::completed);
    EXPECT_EQ(out[3].status, task_status::completed);
}

TEST(BulkReconcileTest, ErrorWithoutMessageGetsGenericText) {
    auto batch = make_batch({"a.pdf"});
    auto out = bulk_batch_coordinator::reconcile(
        batch, make_status(job_state::completed_with_errors, 0, {"a.pdf"}));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].status, task_status::failed);
    EXPECT_EQ(out[0].error.value(), "upload failed");
}

TEST(BulkReconcileTest, FailedJobFailsUnaccountedFiles) {
    auto batch = make_batch({"a.pdf", "b.pdf", "c.pdf"});
    auto out = bulk_batch_coordinator::reconcile(batch, make_status(job_state::failed, 1));

    EXPECT_EQ(out[0].status, task_status::completed);
    EXPECT_EQ(out[1].status, task_status::failed);
    EXPECT_EQ(out[1].error.value(), "bulk job failed");
    EXPECT_EQ(out[2].status, task_status::failed);
}

TEST(BulkReconcileTest, CancelledJobKeepsFinishedFiles) {
    auto batch = make_batch({"a.pdf", "b.pdf", "c.pdf"});
    auto out = bulk_batch_coordinator::reconcile(batch, make_status(job_state::cancelled, 1));

    EXPECT_EQ(out[0].status, task_status::completed);
    EXPECT_EQ(out[1].status, task_status::cancelled);
    EXPECT_EQ(out[2].status, task_status::cancelled);
    EXPECT_FALSE(out[2].error.has_value());
}

TEST(BulkReconcileTest, UnknownOrRunningJobCancelsRemainder) {
    auto batch = make_batch({"a.pdf", "b.pdf"});

    auto none = bulk_batch_coordinator::reconcile(batch, std::nullopt);
    EXPECT_EQ(none[0].status, task_status::cancelled);
    EXPECT_EQ(none[1].status, task_status::cancelled);

    auto running = bulk_batch_coordinator::reconcile(
        batch, make_status(job_state::processing, 1));
    EXPECT_EQ(running[0].status, task_status::completed);
    EXPECT_EQ(running[1].status, task_status::cancelled);
}

TEST(BulkReconcileTest, DuplicateNamesConsumeOneErrorEach) {
    auto batch = make_batch({"same.pdf", "same.pdf", "other.pdf"});
    auto out = bulk_batch_coordinator::reconcile(
        batch, make_status(job_state::completed_with_errors, 1, {"same.pdf: bad"}));

    EXPECT_EQ(out[0].status, task_status::failed);
    EXPECT_EQ(out[0].error.value(), "bad");
    EXPECT_EQ(out[1].status, task_status::completed);
    EXPECT_EQ(out[2].status, task_status::completed);
}

TEST(BulkReconcileTest, PathPrefixedErrorMatchesFileName) {
    auto batch = make_batch({"a.pdf", "b.pdf", "c.pdf"});
    auto out = bulk_batch_coordinator::reconcile(
        batch, make_status(job_state::completed_with_errors, 2, {"uploads/b.pdf: rejected"}));

    EXPECT_EQ(out[0].status, task_status::completed);
    EXPECT_EQ(out[1].status, task_status::failed);
    EXPECT_EQ(out[1].error.value(), "rejected");
    EXPECT_EQ(out[2].status, task_status::completed);
}

TEST(BulkReconcileTest, UnmatchedErrorsStillFailFiles) {
    auto batch = make_batch({"a.pdf", "b.pdf", "c.pdf"});
    auto status = make_status(job_state::completed_with_errors, 1, {"elsewhere/x.pdf: rejected"});
    status.error_count = 2;

    auto out = bulk_batch_coordinator::reconcile(batch, status);

    EXPECT_EQ(out[0].status, task_status::completed);
    EXPECT_EQ(out[1].status, task_status::failed);
    EXPECT_EQ(out[1].error.value(), "rejected");
    EXPECT_EQ(out[2].status, task_status::failed);
    EXPECT_EQ(out[2].error.value(), "upload failed");
}

// =============================================================================
// Running batches against a backend
// =============================================================================

class BulkBatchCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_console_output(false);
        backend_ = std::make_shared<mock_upload_backend>();
        aggregator_ = std::make_shared<progress_aggregator>();
        control_ = std::make_shared<transfer_control>();
        config_.batch_size = 20;
        config_.poll_interval = std::chrono::milliseconds(2);
    }

    void TearDown() override {
        get_logger().set_console_output(true);
    }

    auto prepare(std::size_t count) -> std::vector<bulk_task> {
        std::vector<std::string> names;
        for (std::size_t i = 0; i < count; ++i) {
            names.push_back("file" + std::to_string(i) + ".pdf");
        }
        return prepare(names);
    }

    auto prepare(const std::vector<std::string>& names) -> std::vector<bulk_task> {
        std::vector<file_task> session_tasks;
        std::vector<bulk_task> tasks;
        for (std::size_t i = 0; i < names.size(); ++i) {
            file_task t;
            t.id = "task-" + std::to_string(i);
            t.name = names[i];
            t.size = 1000;
            session_tasks.push_back(t);
            tasks.push_back({t.id, make_file(t.name, t.size)});
        }
        EXPECT_TRUE(aggregator_->begin_session(session_tasks, transfer_path::bulk));
        return tasks;
    }

    void record_counts() {
        aggregator_->subscribe([this](const transfer_session& s) {
            completed_counts_.push_back(s.completed);
            failed_counts_.push_back(s.failed);
        });
    }

    auto make_coordinator() -> bulk_batch_coordinator {
        return bulk_batch_coordinator(backend_, aggregator_, control_, config_, "scans");
    }

    std::shared_ptr<mock_upload_backend> backend_;
    std::shared_ptr<progress_aggregator> aggregator_;
    std::shared_ptr<transfer_control> control_;
    bulk_config config_;
    std::vector<std::size_t> completed_counts_;
    std::vector<std::size_t> failed_counts_;
};

TEST_F(BulkBatchCoordinatorTest, BatchesRunOneAtATime) {
    auto tasks = prepare(45);

    make_coordinator().run(tasks);

    EXPECT_EQ(backend_->job_sizes(), (std::vector<std::size_t>{20, 20, 5}));
    EXPECT_EQ(backend_->peak_active_jobs(), 1u);
    EXPECT_EQ(backend_->categories(), std::set<std::string>{"scans"});

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.completed, 45u);
    EXPECT_EQ(s.uploaded_bytes, s.total_bytes);
    EXPECT_EQ(s.bulk_job_id.value(), "job-3");
}

TEST_F(BulkBatchCoordinatorTest, PollFailuresAreRetried) {
    backend_->fail_polls(3);
    auto tasks = prepare(5);

    make_coordinator().run(tasks);

    EXPECT_EQ(aggregator_->snapshot().completed, 5u);
    EXPECT_GE(backend_->poll_calls(), 5u);
}

TEST_F(BulkBatchCoordinatorTest, ReportedErrorsFailNamedFiles) {
    backend_->set_bulk_script([](const std::vector<file_ref>& files) {
        job_status done;
        done.status = job_state::completed_with_errors;
        done.success_count = files.size() - 1;
        done.error_count = 1;
        done.errors = {files[1].name + ": unsupported format"};
        return std::vector<job_status>{done};
    });
    auto tasks = prepare(4);

    make_coordinator().run(tasks);

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.completed, 3u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.find("task-1")->error.value(), "unsupported format");
}

TEST_F(BulkBatchCoordinatorTest, SubmitFailureFailsOnlyThatBatch) {
    backend_->fail_bulk_submits(1);
    auto tasks = prepare(25);

    make_coordinator().run(tasks);

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.failed, 20u);
    EXPECT_EQ(s.completed, 5u);
    EXPECT_EQ(backend_->job_sizes(), (std::vector<std::size_t>{5}));
}

TEST_F(BulkBatchCoordinatorTest, ProvisionalProgressIsPublished) {
    backend_->set_bulk_script([](const std::vector<file_ref>& files) {
        job_status halfway;
        halfway.status = job_state::processing;
        halfway.success_count = files.size() / 2;
        halfway.current_file = files[files.size() / 2].name;

        job_status done;
        done.status = job_state::completed;
        done.success_count = files.size();
        return std::vector<job_status>{halfway, done};
    });
    auto tasks = prepare(10);

    std::vector<std::size_t> completed_counts;
    aggregator_->subscribe([&](const transfer_session& s) {
        completed_counts.push_back(s.completed);
    });

    make_coordinator().run(tasks);

    EXPECT_NE(std::find(completed_counts.begin(), completed_counts.end(), 5u),
              completed_counts.end());
    EXPECT_EQ(completed_counts.back(), 10u);
    EXPECT_TRUE(std::is_sorted(completed_counts.begin(), completed_counts.end()));
}

TEST_F(BulkBatchCoordinatorTest, CancelStopsJobAndSkipsLaterBatches) {
    backend_->set_bulk_script([](const std::vector<file_ref>&) {
        return std::vector<job_status>{make_status(job_state::processing, 2)};
    });
    auto tasks = prepare(30);
    auto coordinator = make_coordinator();

    std::thread runner([&] { coordinator.run(tasks); });
    while (backend_->poll_calls() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    control_->cancel();
    runner.join();

    EXPECT_EQ(backend_->cancel_calls(), 1u);
    EXPECT_EQ(backend_->job_sizes().size(), 1u);

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.completed, 2u);
    EXPECT_EQ(s.cancelled, 28u);
}

TEST_F(BulkBatchCoordinatorTest, FinalErrorsNeverLowerFailedCount) {
    backend_->set_bulk_script([](const std::vector<file_ref>&) {
        auto halfway = make_status(job_state::processing, 2);
        halfway.error_count = 1;
        auto done = make_status(job_state::completed_with_errors, 2, {"uploads/other.pdf: rejected"});
        return std::vector<job_status>{halfway, done};
    });
    auto tasks = prepare({"a.pdf", "b.pdf", "c.pdf"});
    record_counts();

    make_coordinator().run(tasks);

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.completed, 2u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.find("task-2")->error.value(), "rejected");
    EXPECT_TRUE(std::is_sorted(completed_counts_.begin(), completed_counts_.end()));
    EXPECT_TRUE(std::is_sorted(failed_counts_.begin(), failed_counts_.end()));
}

TEST_F(BulkBatchCoordinatorTest, DuplicateNamesNeverLowerCompletedCount) {
    backend_->set_bulk_script([](const std::vector<file_ref>&) {
        auto halfway = make_status(job_state::processing, 1);
        auto done = make_status(job_state::completed_with_errors, 1, {"same.pdf: rejected"});
        return std::vector<job_status>{halfway, done};
    });
    auto tasks = prepare({"same.pdf", "same.pdf"});
    record_counts();

    make_coordinator().run(tasks);

    auto s = aggregator_->snapshot();
    EXPECT_EQ(s.completed, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_TRUE(std::is_sorted(completed_counts_.begin(), completed_counts_.end()));
    EXPECT_TRUE(std::is_sorted(failed_counts_.begin(), failed_counts_.end()));
}

}  // namespace kcenon::upload_orchestrator::test
