#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <vector>

#include "../include/cursor_sequence.hpp"
#include "../include/windowed_map.hpp"

using namespace revhist;

namespace revhist::benchmark {

RevisionWindowedMap<int64_t> make_history(int64_t count) {
  RevisionWindowedMap<int64_t> map;
  for (int64_t rev = 0; rev < count; ++rev) {
    if (!map.set(rev * 2, rev).ok()) break;
  }
  return map;
}

// Successive reads close together only shift the window a little
void BM_NeighborLookups(::benchmark::State& state) {
  const int64_t count = state.range(0);
  auto map = make_history(count);
  int64_t rev = count;

  for (auto _ : state) {
    auto slot = map.get(rev);
    ::benchmark::DoNotOptimize(slot);
    rev = rev + 3 < 2 * count ? rev + 3 : 0;
  }

  state.SetItemsProcessed(state.iterations());
}

void BM_RandomLookups(::benchmark::State& state) {
  const int64_t count = state.range(0);
  auto map = make_history(count);
  std::mt19937_64 rng(42);
  std::uniform_int_distribution<int64_t> dist(0, 2 * count);

  for (auto _ : state) {
    auto slot = map.get(dist(rng));
    ::benchmark::DoNotOptimize(slot);
  }

  state.SetItemsProcessed(state.iterations());
}

void BM_CursorLocalSeek(::benchmark::State& state) {
  const int64_t count = state.range(0);
  CursorSequence<int64_t> seq;
  for (int64_t i = 0; i < count; ++i) {
    seq.push_back(i);
  }
  if (!seq.seek(count / 2).ok()) {
    state.SkipWithError("seek to the middle failed");
    return;
  }
  int64_t delta = 1;

  for (auto _ : state) {
    auto value = seq.seek(delta);
    ::benchmark::DoNotOptimize(value);
    delta = -delta;
  }

  state.SetItemsProcessed(state.iterations());
}

void BM_IndexFromEnds(::benchmark::State& state) {
  const int64_t count = state.range(0);
  CursorSequence<int64_t> seq;
  for (int64_t i = 0; i < count; ++i) {
    seq.push_back(i);
  }
  const int64_t middle = count / 2;

  for (auto _ : state) {
    state.PauseTiming();
    seq.reset_cursor();
    state.ResumeTiming();
    auto value = seq.at(middle);
    ::benchmark::DoNotOptimize(value);
  }

  state.SetItemsProcessed(state.iterations());
}

void BM_TruncateAndRebuild(::benchmark::State& state) {
  const int64_t count = state.range(0);

  for (auto _ : state) {
    state.PauseTiming();
    auto map = make_history(count);
    state.ResumeTiming();
    if (!map.truncate_from(count).ok()) {
      state.SkipWithError("truncate_from failed");
      break;
    }
    for (int64_t rev = count + 1; rev < 2 * count; ++rev) {
      if (!map.set(rev, rev).ok()) {
        state.SkipWithError("set after truncate failed");
        break;
      }
    }
    ::benchmark::DoNotOptimize(map);
  }

  state.SetItemsProcessed(state.iterations() * count);
}

}  // namespace revhist::benchmark

BENCHMARK(revhist::benchmark::BM_NeighborLookups)
    ->RangeMultiplier(10)
    ->Range(100, 100000)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(revhist::benchmark::BM_RandomLookups)
    ->RangeMultiplier(10)
    ->Range(100, 100000)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(revhist::benchmark::BM_CursorLocalSeek)
    ->RangeMultiplier(10)
    ->Range(100, 100000)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(revhist::benchmark::BM_IndexFromEnds)
    ->RangeMultiplier(10)
    ->Range(100, 100000)
    ->Unit(::benchmark::kNanosecond);

BENCHMARK(revhist::benchmark::BM_TruncateAndRebuild)
    ->RangeMultiplier(10)
    ->Range(100, 10000)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK_MAIN();
