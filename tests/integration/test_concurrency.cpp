/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for upload sessions
 */

#include "test_fixtures.h"

#include <atomic>
#include <random>
#include <thread>
#include <vector>

namespace kcenon::upload_orchestrator::test {

class ConcurrencyTest : public OrchestratorFixture {};

// =============================================================================
// Observers
// =============================================================================

TEST_F(ConcurrencyTest, ObserversMayQueryOrchestrator) {
    build(default_builder().with_concurrency(4));
    backend_->single_latency = std::chrono::milliseconds(2);
    watch();

    std::atomic<int> calls{0};
    orchestrator_->subscribe([&](const transfer_session& s) {
        auto current = orchestrator_->snapshot();
        EXPECT_GE(current.sequence, s.sequence);
        (void)orchestrator_->is_running();
        ++calls;
    });

    ASSERT_TRUE(orchestrator_->start_upload(make_files(12, 1024)));
    auto s = finish();

    EXPECT_EQ(s.completed, 12u);
    EXPECT_GT(calls.load(), 12);
    EXPECT_FALSE(invariant_violated_);
}

TEST_F(ConcurrencyTest, ObserverMayCancelSession) {
    build(default_builder().with_concurrency(3));
    backend_->single_latency = std::chrono::milliseconds(5);

    std::atomic<bool> cancel_sent{false};
    orchestrator_->subscribe([&](const transfer_session& s) {
        if (s.completed >= 3 && !cancel_sent.exchange(true)) {
            EXPECT_TRUE(orchestrator_->cancel());
        }
    });

    ASSERT_TRUE(orchestrator_->start_upload(make_files(15, 1024)));
    auto s = finish();

    EXPECT_TRUE(cancel_sent.load());
    EXPECT_EQ(s.status, session_status::complete);
    EXPECT_GE(s.completed, 3u);
    EXPECT_GT(s.cancelled, 0u);
    EXPECT_EQ(s.completed + s.cancelled, 15u);
}

TEST_F(ConcurrencyTest, ConcurrentReadersSeeMonotonicSnapshots) {
    build(default_builder().with_concurrency(5));
    backend_->single_latency = std::chrono::milliseconds(1);

    ASSERT_TRUE(orchestrator_->start_upload(make_files(20, 4096)));

    std::atomic<bool> regressed{false};
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            uint64_t last = 0;
            while (orchestrator_->is_running()) {
                auto s = orchestrator_->snapshot();
                if (s.sequence < last ||
                    s.completed + s.failed + s.cancelled > s.total) {
                    regressed = true;
                }
                last = s.sequence;
            }
        });
    }

    auto s = finish();
    for (auto& t : readers) {
        t.join();
    }

    EXPECT_EQ(s.completed, 20u);
    EXPECT_FALSE(regressed.load());
}

// =============================================================================
// Stress
// =============================================================================

TEST_F(ConcurrencyTest, RandomTransientFailuresUnderLoad) {
    build(default_builder().with_concurrency(8).with_max_retries(2));
    backend_->single_latency = std::chrono::milliseconds(1);
    watch();

    std::mt19937 gen(7);
    std::uniform_int_distribution<int> failures(0, 3);
    auto files = make_files(40, 2048);
    for (const auto& f : files) {
        if (auto n = failures(gen); n > 0) {
            backend_->fail_file(f.name, error_code::server_error, static_cast<uint32_t>(n));
        }
    }

    ASSERT_TRUE(orchestrator_->start_upload(files));
    auto s = finish();

    // Three injected failures exhaust three attempts
    std::size_t expected_failed = 0;
    for (const auto& task : s.files) {
        EXPECT_TRUE(task.is_terminal());
        EXPECT_LE(backend_->attempts(task.name), 3u);
        if (backend_->attempts(task.name) == 3 && task.status == task_status::failed) {
            ++expected_failed;
        }
    }
    EXPECT_EQ(s.failed, expected_failed);
    EXPECT_EQ(s.completed + s.failed, 40u);
    EXPECT_LE(backend_->peak_file_concurrency(), 8u);
    EXPECT_FALSE(invariant_violated_);
}

TEST_F(ConcurrencyTest, PauseResumeToggling) {
    build(default_builder().with_concurrency(3));
    backend_->single_latency = std::chrono::milliseconds(3);
    watch();

    ASSERT_TRUE(orchestrator_->start_upload(make_files(20, 1024)));

    std::thread toggler([&] {
        for (int i = 0; i < 10 && orchestrator_->is_running(); ++i) {
            (void)orchestrator_->pause();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            (void)orchestrator_->resume();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        (void)orchestrator_->resume();
    });
    toggler.join();

    auto s = finish();
    EXPECT_EQ(s.completed, 20u);
    EXPECT_EQ(s.status, session_status::complete);
    EXPECT_FALSE(invariant_violated_);
}

TEST_F(ConcurrencyTest, RacingControlCallsAlwaysEndComplete) {
    build(default_builder().with_concurrency(4));
    backend_->single_latency = std::chrono::milliseconds(2);

    ASSERT_TRUE(orchestrator_->start_upload(make_files(30, 1024)));

    std::vector<std::thread> callers;
    callers.emplace_back([&] {
        for (int i = 0; i < 20; ++i) (void)orchestrator_->pause();
    });
    callers.emplace_back([&] {
        for (int i = 0; i < 20; ++i) (void)orchestrator_->resume();
    });
    callers.emplace_back([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        (void)orchestrator_->cancel();
    });
    for (auto& t : callers) {
        t.join();
    }

    auto s = finish();
    EXPECT_EQ(s.status, session_status::complete);
    EXPECT_EQ(s.count(task_status::pending), 0u);
    EXPECT_EQ(s.count(task_status::uploading), 0u);
    EXPECT_EQ(s.completed + s.failed + s.cancelled, 30u);
}

TEST_F(ConcurrencyTest, SequentialSessions) {
    build(default_builder().with_concurrency(4));

    for (int round = 0; round < 5; ++round) {
        ASSERT_TRUE(orchestrator_->start_upload(
            make_files(6, 512, "round" + std::to_string(round) + "_")));
        auto s = finish();
        EXPECT_EQ(s.completed, 6u) << "round " << round;
        ASSERT_TRUE(orchestrator_->dismiss());
    }
    EXPECT_EQ(backend_->uploaded().size(), 30u);
}

}  // namespace kcenon::upload_orchestrator::test
