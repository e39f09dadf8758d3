// cursorvec-cpp benchmarks — measures throughput of cursor operations.

#include <cursorvec-cpp/cursorvec.hpp>

#include <benchmark/benchmark.h>

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

using namespace cursorvec_cpp;

static auto make_vec(std::size_t n, bool rotating) -> CursorVec<std::int64_t> {
    auto values = std::vector<std::int64_t>(n);
    std::iota(values.begin(), values.end(), std::int64_t{0});
    return CursorVec<std::int64_t>{}.rotatable(rotating).with_container(std::move(values));
}

// =============================================================================
// Single steps
// =============================================================================

static void bm_move_next_and_get_rotating(benchmark::State& state) {
    auto vec = make_vec(1000, true);
    for (auto _ : state) {
        auto cur = vec.move_next_and_get();
        benchmark::DoNotOptimize(cur);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_move_next_and_get_rotating);

static void bm_move_next_at_max_out(benchmark::State& state) {
    auto vec = make_vec(1000, false);
    if (!is_ok(vec.set_cursor(999))) {
        state.SkipWithError("set_cursor failed");
        return;
    }
    for (auto _ : state) {
        auto cur = vec.move_next_and_get();
        benchmark::DoNotOptimize(cur);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_move_next_at_max_out);

static void bm_plain_move_round_trip(benchmark::State& state) {
    auto vec = make_vec(1000, true);
    for (auto _ : state) {
        auto fwd = vec.move_next();
        auto back = vec.move_prev();
        benchmark::DoNotOptimize(fwd);
        benchmark::DoNotOptimize(back);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_plain_move_round_trip);

// =============================================================================
// N-step moves
// =============================================================================

static void bm_move_next_nth_rotating(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    auto vec = make_vec(64, true);
    for (auto _ : state) {
        auto cur = vec.move_next_nth_and_get(steps);
        benchmark::DoNotOptimize(cur);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * steps));
}
BENCHMARK(bm_move_next_nth_rotating)->Range(8, 4096);

static void bm_move_nth_always_bounded(benchmark::State& state) {
    const auto steps = static_cast<std::size_t>(state.range(0));
    auto vec = make_vec(1024, false);
    for (auto _ : state) {
        auto last = vec.move_next_nth_and_get_always(steps);
        auto first = vec.move_prev_nth_and_get_always(steps);
        benchmark::DoNotOptimize(last);
        benchmark::DoNotOptimize(first);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * steps * 2));
}
BENCHMARK(bm_move_nth_always_bounded)->Range(8, 1024);

// =============================================================================
// Resynchronization
// =============================================================================

static void bm_modify_push_pop(benchmark::State& state) {
    auto vec = make_vec(1000, false);
    for (auto _ : state) {
        vec.modify([](auto& v) { v.push_back(42); });
        vec.modify([](auto& v) { v.pop_back(); });
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(bm_modify_push_pop);

static void bm_modify_filter(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto vec = make_vec(n, false);
        const auto placed = is_ok(vec.set_cursor(n - 1));
        state.ResumeTiming();
        if (!placed) {
            state.SkipWithError("set_cursor failed");
            break;
        }

        vec.modify([](auto& v) {
            std::erase_if(v, [](std::int64_t x) { return x % 2 != 0; });
        });
        benchmark::DoNotOptimize(vec);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_modify_filter)->Range(16, 16384);

static void bm_update_cursor(benchmark::State& state) {
    auto vec = make_vec(1000, false);
    for (auto _ : state) {
        vec.update_cursor();
        benchmark::DoNotOptimize(vec);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_update_cursor);
