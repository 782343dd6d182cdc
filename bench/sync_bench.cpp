#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>

#include "framesync/agg/avg.hpp"
#include "framesync/agg/median.hpp"
#include "framesync/frames.hpp"
#include "framesync/sync.hpp"

using namespace framesync;

// Generate a feature matrix and beat frames with fixed seed for reproducible benchmarks
feature_matrix<double> generate_features(size_t n_features, size_t n_frames, uint32_t seed = 42) {
  feature_matrix<double> m(n_features);
  m.reserve(n_frames);

  std::mt19937 gen(seed);
  std::normal_distribution<double> dist(0.0, 1.0);

  std::vector<double> frame(n_features);
  for (size_t t = 0; t < n_frames; ++t) {
    for (auto &v : frame) {
      v = dist(gen);
    }
    m.append(frame);
  }
  return m;
}

std::vector<i64> generate_beats(size_t n_frames, uint32_t seed = 123) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<i64> gap_dist(15, 40); // roughly 90 - 240 bpm at 22050 / 512

  std::vector<i64> beats;
  for (i64 t = gap_dist(gen); t < static_cast<i64>(n_frames); t += gap_dist(gen)) {
    beats.push_back(t);
  }
  return beats;
}

// Global shared data for fair comparison
const size_t NUM_FEATURES = 84;  // CQT bins
const size_t NUM_FRAMES = 50000; // ~20 minutes of audio
const auto SHARED_FEATURES = generate_features(NUM_FEATURES, NUM_FRAMES);
const auto SHARED_BEATS = generate_beats(NUM_FRAMES);

static void BM_SyncMean(benchmark::State &state) {
  sync_options opts;
  opts.workers = static_cast<size_t>(state.range(0));

  for (auto _ : state) {
    auto out = sync(SHARED_FEATURES, SHARED_BEATS, agg::avg<double>{}, opts);
    benchmark::DoNotOptimize(out);
  }

  state.SetItemsProcessed(static_cast<int64_t>(NUM_FEATURES * NUM_FRAMES * static_cast<size_t>(state.iterations())));
}

static void BM_SyncMedian(benchmark::State &state) {
  sync_options opts;
  opts.workers = static_cast<size_t>(state.range(0));

  for (auto _ : state) {
    auto out = sync(SHARED_FEATURES, SHARED_BEATS, agg::median<double>{}, opts);
    benchmark::DoNotOptimize(out);
  }

  state.SetItemsProcessed(static_cast<int64_t>(NUM_FEATURES * NUM_FRAMES * static_cast<size_t>(state.iterations())));
}

// Executor reused across calls, no per-call clone
static void BM_ExecReuse(benchmark::State &state) {
  auto const segs = index_to_segments(SHARED_BEATS, 0, static_cast<i64>(NUM_FRAMES));
  sync_exec<double> exec(agg::median<double>{}, static_cast<size_t>(state.range(0)));

  for (auto _ : state) {
    auto out = exec.run(SHARED_FEATURES, segs);
    benchmark::DoNotOptimize(out);
  }

  state.SetItemsProcessed(static_cast<int64_t>(NUM_FEATURES * NUM_FRAMES * static_cast<size_t>(state.iterations())));
}

// Register benchmarks
BENCHMARK(BM_SyncMean)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_SyncMedian)->Arg(1)->Arg(2)->Arg(4)->Unit(benchmark::kMillisecond);
BENCHMARK(BM_ExecReuse)->Arg(1)->Arg(4)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
