#include "framesync/agg/median.hpp"
#include "framesync/agg/minmax.hpp"
#include "framesync/agg/var.hpp"
#include "framesync/frames.hpp"
#include "framesync/logging.hpp"
#include "framesync/subsegment.hpp"
#include "framesync/sync.hpp"

#include <cmath>
#include <iostream>
#include <random>
#include <vector>

using namespace framesync;

namespace {
constexpr double sample_rate = 22050.0;
constexpr i64 hop = 512;

// 12 chroma-like bins over 2 seconds, one active pitch class per 0.5s
feature_matrix<float> make_chroma() {
  size_t const n_frames = static_cast<size_t>(time_to_frames(2.0, sample_rate, hop));
  std::mt19937 gen(42);
  std::normal_distribution<float> noise(0.0f, 0.05f);

  feature_matrix<float> m(12);
  m.reserve(n_frames);
  for (size_t t = 0; t < n_frames; ++t) {
    auto const active = static_cast<size_t>(frames_to_time(static_cast<i64>(t), sample_rate, hop) / 0.5) * 3 % 12;
    std::vector<float> frame(12);
    for (size_t bin = 0; bin < 12; ++bin) {
      frame[bin] = (bin == active ? 1.0f : 0.0f) + noise(gen);
    }
    m.append(frame);
  }
  return m;
}

void print_shape(char const *label, feature_matrix<float> const &m) {
  std::cout << label << ": " << m.nfeat() << " x " << m.nframe() << "\n";
}
} // namespace

void example_beat_sync(feature_matrix<float> const &chroma, std::vector<i64> const &beats) {
  std::cout << "=== Beat-synchronous chroma ===\n";

  auto const bounds = fix_frames(beats, 0, static_cast<i64>(chroma.nframe()));
  std::cout << "Boundaries:";
  for (auto b : bounds) {
    std::cout << ' ' << b;
  }
  std::cout << "\n";

  print_shape("Frame-level", chroma);
  print_shape("Beat mean", sync(chroma, beats));
  print_shape("Beat median", sync(chroma, beats, agg::median<float>{}));

  sync_options opts;
  opts.workers = 0;
  print_shape("Beat stddev (parallel)", sync(chroma, beats, agg::stddev<float>{}, opts));
  std::cout << "\n";
}

void example_sub_beats(feature_matrix<float> const &chroma, std::vector<i64> const &beats) {
  std::cout << "=== Sub-beat segmentation ===\n";

  auto const sub = subsegment(chroma, beats, 2);
  auto const times = frames_to_time(sub, sample_rate, hop);
  std::cout << "Sub-beat times:";
  for (auto t : times) {
    std::cout << ' ' << t;
  }
  std::cout << "\n";

  print_shape("Sub-beat mean", sync(chroma, sub));
  std::cout << "\n";
}

void example_feature_pooling(feature_matrix<float> const &chroma) {
  std::cout << "=== Feature pooling ===\n";

  // group 12 bins into 4 bands
  std::vector<i64> bands = {3, 6, 9};
  sync_options opts;
  opts.axis = sync_axis::features;
  print_shape("Band max", sync(chroma, bands, agg::max<float>{}, opts));
  std::cout << "\n";
}

int main() {
  set_log_verbosity_from_env();

  auto const chroma = make_chroma();

  // a beat every 0.25s
  std::vector<double> beat_times;
  for (double t = 0.25; t < 2.0; t += 0.25) {
    beat_times.push_back(t);
  }
  auto const beats = time_to_frames(beat_times, sample_rate, hop);

  try {
    example_beat_sync(chroma, beats);
    example_sub_beats(chroma, beats);
    example_feature_pooling(chroma);
  } catch (std::exception const &e) {
    FRAMESYNC_LOG_ERROR(e.what());
    return 1;
  }
  return 0;
}
