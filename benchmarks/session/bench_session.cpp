/**
 * @file bench_session.cpp
 * @brief Benchmarks for session bookkeeping and orchestration overhead
 *
 * The backend answers instantly, so the numbers reflect scheduling and
 * progress aggregation cost only.
 */

#include <benchmark/benchmark.h>

#include <kcenon/upload_orchestrator/upload_orchestrator.h>
#include <kcenon/upload_orchestrator/core/progress_aggregator.h>
#include <kcenon/upload_orchestrator/core/strategy_selector.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::upload_orchestrator::benchmark {

namespace {

auto make_tasks(std::size_t count, uint64_t size) -> std::vector<file_task> {
    std::vector<file_task> tasks;
    tasks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        file_task task;
        task.id = "task-" + std::to_string(i);
        task.name = "bench_" + std::to_string(i) + ".bin";
        task.size = size;
        tasks.push_back(std::move(task));
    }
    return tasks;
}

}  // namespace

/**
 * @brief Strategy planning for a submission of N files
 */
static void BM_StrategySelector_Plan(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto files = test_data_generator::generate_files(count, 16, 7);
    strategy_selector selector;

    for (auto _ : state) {
        auto plan = selector.plan(files);
        ::benchmark::DoNotOptimize(plan);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Full task lifecycle through the aggregator, one observer attached
 */
static void BM_ProgressAggregator_TaskLifecycle(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    constexpr uint64_t task_size = 4 * sizes::KB;
    auto tasks = make_tasks(count, task_size);

    for (auto _ : state) {
        progress_aggregator aggregator;
        uint64_t delivered = 0;
        aggregator.subscribe([&delivered](const transfer_session&) { ++delivered; });

        if (!aggregator.begin_session(tasks, transfer_path::direct)) {
            state.SkipWithError("Failed to begin session");
            return;
        }
        for (const auto& task : tasks) {
            (void)aggregator.mark_started(task.id);
            (void)aggregator.update_bytes(task.id, task_size / 2);
            (void)aggregator.update_bytes(task.id, task_size);
            (void)aggregator.mark_completed(task.id);
        }
        (void)aggregator.set_session_status(session_status::complete);
        ::benchmark::DoNotOptimize(delivered);
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Direct-path session end to end
 */
static void BM_Orchestrator_DirectSession(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto file_size = static_cast<std::size_t>(state.range(1));
    auto files = test_data_generator::generate_files(count, file_size, 11);
    auto backend = std::make_shared<instant_backend>();

    auto orchestrator = upload_orchestrator::builder()
                            .with_backend(backend)
                            .with_concurrency(static_cast<std::size_t>(state.range(2)))
                            .build();
    if (!orchestrator) {
        state.SkipWithError("Failed to build orchestrator");
        return;
    }

    for (auto _ : state) {
        if (!orchestrator.value().start_upload(files)) {
            state.SkipWithError("Failed to start session");
            return;
        }
        auto final_state = orchestrator.value().wait();
        ::benchmark::DoNotOptimize(final_state);
        (void)orchestrator.value().dismiss();
    }

    state.SetBytesProcessed(static_cast<int64_t>(count * file_size) *
                           static_cast<int64_t>(state.iterations()));
    state.counters["files/s"] = ::benchmark::Counter(
        static_cast<double>(count) * static_cast<double>(state.iterations()),
        ::benchmark::Counter::kIsRate);
}

/**
 * @brief Bulk-path session end to end
 */
static void BM_Orchestrator_BulkSession(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto files = test_data_generator::generate_files(count, 1 * sizes::KB, 13);
    auto backend = std::make_shared<instant_backend>();

    auto orchestrator = upload_orchestrator::builder()
                            .with_backend(backend)
                            .with_poll_interval(std::chrono::milliseconds(1))
                            .build();
    if (!orchestrator) {
        state.SkipWithError("Failed to build orchestrator");
        return;
    }

    for (auto _ : state) {
        if (!orchestrator.value().start_upload(files)) {
            state.SkipWithError("Failed to start session");
            return;
        }
        auto final_state = orchestrator.value().wait();
        ::benchmark::DoNotOptimize(final_state);
        (void)orchestrator.value().dismiss();
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                           static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_StrategySelector_Plan)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_ProgressAggregator_TaskLifecycle)
    ->Arg(10)
    ->Arg(100)
    ->Arg(500)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Orchestrator_DirectSession)
    ->Args({10, static_cast<int64_t>(64 * sizes::KB), 5})
    ->Args({20, static_cast<int64_t>(64 * sizes::KB), 1})
    ->Args({20, static_cast<int64_t>(64 * sizes::KB), 5})
    ->Args({20, static_cast<int64_t>(64 * sizes::KB), 10})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

BENCHMARK(BM_Orchestrator_BulkSession)
    ->Arg(45)
    ->Arg(200)
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::upload_orchestrator::benchmark
