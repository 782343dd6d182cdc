#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "segment.hpp"

namespace framesync {
/**
 * @brief Normalise raw frame indices into a sorted, unique boundary list
 *
 * With pad, frames are first clipped into [x_min, x_max] and x_min (and x_max when given) are added, so the result
 * starts at x_min and ends at x_max. Frames outside [x_min, x_max] are then dropped.
 *
 * Example (x_min = 0, x_max = 10):
 *
 * | input        | pad   | output          |
 * |--------------|-------|-----------------|
 * | 3, 7, 3, 14  | true  | 0, 3, 7, 10     |
 * | 3, 7, 3, 14  | false | 3, 7            |
 * | (empty)      | true  | 0, 10           |
 *
 * @param frames Raw frame indices, any order, duplicates allowed
 * @param x_min  Lower bound, inclusive
 * @param x_max  Upper bound, inclusive. No upper bound when empty.
 * @param pad    Clip and add the bounds
 * @throws invalid_boundary if any frame is negative
 * @throws std::invalid_argument if x_min is negative or exceeds x_max
 */
template <range_of<i64> R>
std::vector<i64> fix_frames(R const &frames, i64 x_min = 0, std::optional<i64> x_max = std::nullopt,
                            bool pad = true) {
  if (x_min < 0) {
    throw std::invalid_argument("fix_frames: x_min must be non-negative");
  }
  if (x_max && *x_max < x_min) {
    throw std::invalid_argument("fix_frames: x_max must not be less than x_min");
  }

  std::vector<i64> out;
  for (auto f : frames) {
    auto const frame = static_cast<i64>(f);
    if (frame < 0) {
      throw invalid_boundary("fix_frames: negative frame index " + std::to_string(frame));
    }
    out.push_back(frame);
  }

  i64 const hi = x_max.value_or(std::numeric_limits<i64>::max());

  if (pad) {
    size_t clipped = 0;
    for (auto &f : out) {
      auto const c = std::clamp(f, x_min, hi);
      clipped += (c != f);
      f = c;
    }
    if (clipped > 0) {
      FRAMESYNC_LOG_DEBUG("fix_frames: clipped " << clipped << " frame(s) into [" << x_min << ", " << hi << "]");
    }
    out.push_back(x_min);
    if (x_max) {
      out.push_back(*x_max);
    }
  }

  std::erase_if(out, [&](i64 f) { return f < x_min || f > hi; });
  std::ranges::sort(out);
  auto dup = std::ranges::unique(out);
  out.erase(dup.begin(), dup.end());
  return out;
}

/**
 * @brief Turn raw frame indices into consecutive half-open segments
 *
 * Normalises with fix_frames, then pairs consecutive boundaries.
 */
template <range_of<i64> R>
std::vector<segment> index_to_segments(R const &frames, i64 x_min = 0, std::optional<i64> x_max = std::nullopt,
                                       bool pad = true) {
  auto const fixed = fix_frames(frames, x_min, x_max, pad);
  std::vector<segment> out;
  if (fixed.size() < 2) {
    return out;
  }
  out.reserve(fixed.size() - 1);
  for (size_t i = 1; i < fixed.size(); ++i) {
    out.push_back({static_cast<size_t>(fixed[i - 1]), static_cast<size_t>(fixed[i] - fixed[i - 1])});
  }
  return out;
}

namespace detail {
inline void check_hop(i64 hop_length) {
  if (hop_length <= 0) {
    throw std::invalid_argument("hop_length must be positive");
  }
}

inline void check_rate(double sr) {
  if (!(sr > 0.0)) {
    throw std::invalid_argument("sample rate must be positive");
  }
}

inline i64 centre_offset(std::optional<i64> n_fft) noexcept { return n_fft ? *n_fft / 2 : 0; }
} // namespace detail

// Frame <-> sample <-> time conversion. With n_fft, frames are taken to be centred on their analysis window.

inline i64 frames_to_samples(i64 frame, i64 hop_length = 512, std::optional<i64> n_fft = std::nullopt) {
  detail::check_hop(hop_length);
  return frame * hop_length + detail::centre_offset(n_fft);
}

inline double frames_to_time(i64 frame, double sr, i64 hop_length = 512, std::optional<i64> n_fft = std::nullopt) {
  detail::check_rate(sr);
  return static_cast<double>(frames_to_samples(frame, hop_length, n_fft)) / sr;
}

inline i64 samples_to_frames(i64 sample, i64 hop_length = 512, std::optional<i64> n_fft = std::nullopt) {
  detail::check_hop(hop_length);
  auto const shifted = sample - detail::centre_offset(n_fft);
  // floor division, shifted may be negative
  auto q = shifted / hop_length;
  if ((shifted % hop_length != 0) && (shifted < 0)) {
    --q;
  }
  return q;
}

inline i64 time_to_frames(double t, double sr, i64 hop_length = 512, std::optional<i64> n_fft = std::nullopt) {
  detail::check_rate(sr);
  return samples_to_frames(static_cast<i64>(std::floor(t * sr)), hop_length, n_fft);
}

template <range_of<i64> R>
std::vector<i64> frames_to_samples(R const &frames, i64 hop_length = 512, std::optional<i64> n_fft = std::nullopt) {
  std::vector<i64> out;
  for (auto f : frames) {
    out.push_back(frames_to_samples(static_cast<i64>(f), hop_length, n_fft));
  }
  return out;
}

template <range_of<i64> R>
std::vector<double> frames_to_time(R const &frames, double sr, i64 hop_length = 512,
                                   std::optional<i64> n_fft = std::nullopt) {
  std::vector<double> out;
  for (auto f : frames) {
    out.push_back(frames_to_time(static_cast<i64>(f), sr, hop_length, n_fft));
  }
  return out;
}

template <range_of<double> R>
std::vector<i64> time_to_frames(R const &times, double sr, i64 hop_length = 512,
                                std::optional<i64> n_fft = std::nullopt) {
  std::vector<i64> out;
  for (auto t : times) {
    out.push_back(time_to_frames(static_cast<double>(t), sr, hop_length, n_fft));
  }
  return out;
}
} // namespace framesync
