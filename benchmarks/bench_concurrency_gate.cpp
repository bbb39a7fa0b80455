/**
 * @file bench_concurrency_gate.cpp
 * @brief Benchmarks for admission and release in the concurrency gate
 */

#include <benchmark/benchmark.h>

#include <kcenon/orchestrator/gate/concurrency_gate.h>

#include <string>
#include <vector>

namespace kcenon::orchestrator::benchmark {

namespace {

auto owner_name(std::size_t index) -> std::string {
    return "owner-" + std::to_string(index);
}

}  // namespace

/**
 * @brief Admit then release one task while the gate is idle
 */
static void BM_Gate_AdmitRelease(::benchmark::State& state) {
    auto gate = concurrency_gate::create({4, 1});
    if (!gate) {
        state.SkipWithError("Failed to create gate");
        return;
    }

    uint64_t next = 1;
    for (auto _ : state) {
        task_id id{next++};
        auto admitted = gate.value().try_admit(id, "alice", task_priority::normal);
        ::benchmark::DoNotOptimize(admitted);
        ::benchmark::DoNotOptimize(gate.value().release(id));
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Release of an active slot with a long wait queue behind it
 *
 * range(0) waiting tasks spread over range(1) owners. Each release admits
 * the next eligible entry, which is then released in turn.
 */
static void BM_Gate_DrainQueue(::benchmark::State& state) {
    const auto waiting = static_cast<std::size_t>(state.range(0));
    const auto owners = static_cast<std::size_t>(state.range(1));

    for (auto _ : state) {
        state.PauseTiming();
        auto gate = concurrency_gate::create({4, 1});
        if (!gate) {
            state.SkipWithError("Failed to create gate");
            return;
        }
        std::vector<task_id> active;
        for (std::size_t i = 0; i < waiting; ++i) {
            task_id id{i + 1};
            auto admitted =
                gate.value().try_admit(id, owner_name(i % owners), task_priority::normal);
            if (!admitted) {
                state.SkipWithError("Admission failed");
                return;
            }
            if (admitted.value().granted) {
                active.push_back(id);
            }
        }
        state.ResumeTiming();

        while (!active.empty()) {
            auto id = active.back();
            active.pop_back();
            for (const auto& next : gate.value().release(id)) {
                active.push_back(next);
            }
        }
        ::benchmark::DoNotOptimize(gate.value().waiting_count());
    }
    state.SetItemsProcessed(static_cast<int64_t>(waiting) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Contended admit and release from several threads
 */
static void BM_Gate_Contended(::benchmark::State& state) {
    static auto gate = concurrency_gate::create({64, 64});
    if (!gate) {
        state.SkipWithError("Failed to create gate");
        return;
    }

    auto owner = owner_name(static_cast<std::size_t>(state.thread_index()));
    uint64_t next = static_cast<uint64_t>(state.thread_index()) << 32;
    for (auto _ : state) {
        task_id id{++next};
        auto admitted = gate.value().try_admit(id, owner, task_priority::normal);
        ::benchmark::DoNotOptimize(admitted);
        if (admitted && admitted.value().granted) {
            gate.value().release(id);
        } else {
            gate.value().remove(id);
        }
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Gate_AdmitRelease)->Unit(::benchmark::kNanosecond);

BENCHMARK(BM_Gate_DrainQueue)
    ->Args({100, 10})
    ->Args({1000, 10})
    ->Args({1000, 100})
    ->Args({10000, 100})
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Gate_Contended)->Threads(1)->Threads(4)->Threads(8)->UseRealTime();

}  // namespace kcenon::orchestrator::benchmark
