#pragma once

#include <concepts>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "agg/avg.hpp"
#include "common.hpp"
#include "error.hpp"
#include "frames.hpp"
#include "logging.hpp"
#include "matrix.hpp"
#include "reducer_base.hpp"
#include "segment.hpp"
#include "sync_exec.hpp"

namespace framesync {

/// Axis along which segments are taken
enum class sync_axis {
  frames,  ///< segments of frames reduce to one column each
  features ///< segments of feature rows reduce to one row each
};

struct sync_options {
  bool pad = true;                    ///< Add 0 and T so leading and trailing partial data form segments
  sync_axis axis = sync_axis::frames; ///< Axis to segment
  size_t workers = 1;                 ///< Worker threads, 0 for hardware concurrency
};

/**
 * @brief Validate a strict boundary list and pair it into segments
 *
 * @param boundaries Strictly increasing frame indices in [0, n_frames]
 * @param n_frames   Number of frames T
 * @throws insufficient_boundaries if fewer than two boundaries are given
 * @throws invalid_boundary if a boundary is negative, greater than T, or not strictly increasing
 */
template <range_of<i64> R>
std::vector<segment> boundaries_to_segments(R const &boundaries, size_t n_frames) {
  std::vector<i64> b;
  for (auto v : boundaries) {
    b.push_back(static_cast<i64>(v));
  }

  if (b.size() < 2) {
    throw insufficient_boundaries("at least two boundaries are required, got " + std::to_string(b.size()));
  }

  auto const limit = static_cast<i64>(n_frames);
  for (size_t i = 0; i < b.size(); ++i) {
    if (b[i] < 0 || b[i] > limit) {
      throw invalid_boundary("boundary " + std::to_string(b[i]) + " at position " + std::to_string(i) +
                             " is outside [0, " + std::to_string(limit) + "]");
    }
    if (i > 0 && b[i] <= b[i - 1]) {
      throw invalid_boundary("boundaries must be strictly increasing, got " + std::to_string(b[i - 1]) + " then " +
                             std::to_string(b[i]) + " at position " + std::to_string(i));
    }
  }

  std::vector<segment> segs;
  segs.reserve(b.size() - 1);
  for (size_t i = 1; i < b.size(); ++i) {
    segs.push_back({static_cast<size_t>(b[i - 1]), static_cast<size_t>(b[i] - b[i - 1])});
  }
  return segs;
}

/**
 * @brief Reduce every segment between consecutive boundaries to one column
 *
 * Boundaries are used as given: no endpoints are added, frames before the first and after the last boundary are
 * not aggregated. Use sync() or fix_frames() to normalise raw frame indices first.
 *
 * Example: 2 x 6 matrix, boundaries 0, 3, 6 -> 2 x 2 matrix, column 0 reduces frames [0, 3), column 1 [3, 6).
 */
template <typename T, typename Alloc, range_of<i64> R>
feature_matrix<T, Alloc> aggregate(feature_matrix<T, Alloc> const &m, R const &boundaries,
                                   std::type_identity_t<reducer_base<T>> const &reducer, size_t workers = 1) {
  auto const segs = boundaries_to_segments(boundaries, m.nframe());
  sync_exec<T> exec(reducer, workers);
  return exec.run(m, segs);
}

template <std::floating_point T, typename Alloc, range_of<i64> R>
feature_matrix<T, Alloc> aggregate(feature_matrix<T, Alloc> const &m, R const &boundaries) {
  return aggregate(m, boundaries, agg::avg<T>{});
}

/**
 * @brief Reduce an explicit list of segments
 *
 * Segments may be in any order and may overlap; column i reduces segs[i].
 */
template <typename T, typename Alloc>
feature_matrix<T, Alloc> aggregate(feature_matrix<T, Alloc> const &m, std::span<segment const> segs,
                                   std::type_identity_t<reducer_base<T>> const &reducer, size_t workers = 1) {
  sync_exec<T> exec(reducer, workers);
  return exec.run(m, segs);
}

/**
 * @brief Beat-synchronous aggregation of raw frame indices
 *
 * Frames are normalised with fix_frames(frames, 0, T, options.pad) and the resulting segments reduced. With
 * options.axis == sync_axis::features, segments run along feature rows instead and every frame is kept.
 *
 * @throws invalid_boundary on negative frames
 * @throws insufficient_boundaries if normalisation leaves no segment (only possible without padding)
 * @throws reducer_error if the reducer fails
 */
template <typename T, typename Alloc, range_of<i64> R>
feature_matrix<T, Alloc> sync(feature_matrix<T, Alloc> const &m, R const &frames,
                              std::type_identity_t<reducer_base<T>> const &reducer, sync_options const &options = {}) {
  if (m.empty()) {
    throw std::invalid_argument("sync: input matrix is empty");
  }

  if (options.axis == sync_axis::features) {
    sync_options inner = options;
    inner.axis = sync_axis::frames;
    return sync(m.transpose(), frames, reducer, inner).transpose();
  }

  auto const bounds = fix_frames(frames, 0, static_cast<i64>(m.nframe()), options.pad);
  FRAMESYNC_LOG_DEBUG("sync: " << bounds.size() << " boundaries over " << m.nframe() << " frames"
                               << (options.pad ? "" : " (unpadded)"));
  return aggregate(m, bounds, reducer, options.workers);
}

template <std::floating_point T, typename Alloc, range_of<i64> R>
feature_matrix<T, Alloc> sync(feature_matrix<T, Alloc> const &m, R const &frames, sync_options const &options = {}) {
  return sync(m, frames, agg::avg<T>{}, options);
}
} // namespace framesync
