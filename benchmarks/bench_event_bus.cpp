/**
 * @file bench_event_bus.cpp
 * @brief Benchmarks for lifecycle event delivery
 */

#include <benchmark/benchmark.h>

#include <kcenon/orchestrator/events/event_bus.h>
#include <kcenon/orchestrator/status/status_tracker.h>

#include <atomic>
#include <chrono>
#include <string>

namespace kcenon::orchestrator::benchmark {

namespace {

auto make_event(uint64_t id, lifecycle_event_type type) -> lifecycle_event {
    lifecycle_event event;
    event.type = type;
    event.snapshot.id = task_id{id};
    event.snapshot.owner_id = "owner-" + std::to_string(id % 16);
    event.snapshot.source = direct_link_source{"https://files.example.com/f.bin", {}};
    event.snapshot.destinations.push_back(cloud_drive_destination{"folder"});
    event.snapshot.state = task_state::downloading;
    event.timestamp = std::chrono::system_clock::now();
    return event;
}

}  // namespace

/**
 * @brief Publish to range(0) unfiltered subscribers
 */
static void BM_EventBus_Publish(::benchmark::State& state) {
    const auto subscribers = static_cast<int>(state.range(0));

    event_bus bus;
    std::atomic<uint64_t> delivered{0};
    for (int i = 0; i < subscribers; ++i) {
        bus.subscribe([&delivered](const lifecycle_event&) { ++delivered; });
    }

    auto event = make_event(1, lifecycle_event_type::progressed);
    for (auto _ : state) {
        bus.publish(event);
    }
    ::benchmark::DoNotOptimize(delivered.load());
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Publish where only one of range(0) subscribers matches the task
 */
static void BM_EventBus_FilteredPublish(::benchmark::State& state) {
    const auto subscribers = static_cast<uint64_t>(state.range(0));

    event_bus bus;
    std::atomic<uint64_t> delivered{0};
    for (uint64_t i = 1; i <= subscribers; ++i) {
        event_filter filter;
        filter.task = task_id{i};
        bus.subscribe([&delivered](const lifecycle_event&) { ++delivered; }, filter);
    }

    auto event = make_event(1, lifecycle_event_type::progressed);
    for (auto _ : state) {
        bus.publish(event);
    }
    ::benchmark::DoNotOptimize(delivered.load());
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Progress updates absorbed by a status tracker
 */
static void BM_StatusTracker_Progress(::benchmark::State& state) {
    const auto tasks = static_cast<uint64_t>(state.range(0));

    event_bus bus;
    status_tracker tracker(bus);
    for (uint64_t i = 1; i <= tasks; ++i) {
        bus.publish(make_event(i, lifecycle_event_type::started));
    }

    uint64_t n = 0;
    auto event = make_event(1, lifecycle_event_type::progressed);
    for (auto _ : state) {
        event.snapshot.id = task_id{n % tasks + 1};
        event.snapshot.progress.transferred_bytes = ++n;
        bus.publish(event);
    }
    ::benchmark::DoNotOptimize(tracker.size());
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_EventBus_Publish)->Arg(1)->Arg(8)->Arg(64)->Unit(::benchmark::kNanosecond);
BENCHMARK(BM_EventBus_FilteredPublish)->Arg(8)->Arg(64)->Arg(512)->Unit(::benchmark::kNanosecond);
BENCHMARK(BM_StatusTracker_Progress)->Arg(16)->Arg(1024)->Unit(::benchmark::kNanosecond);

}  // namespace kcenon::orchestrator::benchmark
