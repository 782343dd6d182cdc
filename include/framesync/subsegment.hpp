#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "common.hpp"
#include "frames.hpp"
#include "logging.hpp"
#include "matrix.hpp"
#include "segment.hpp"

namespace framesync {
namespace detail {
/**
 * @brief Bottom-up Ward clustering of the frames in span, restricted to temporally adjacent clusters
 *
 * Starts with one cluster per frame and repeatedly merges the adjacent pair whose merge increases the within-cluster
 * sum of squares the least:
 *
 *   cost(a, b) = na * nb / (na + nb) * ||mean_a - mean_b||^2
 *
 * Ties go to the earliest pair. Clusters stay contiguous, so the result is a partition of span into k runs.
 *
 * @return Left edge of every cluster relative to span.offset, starting with 0
 */
template <typename T, typename Alloc>
std::vector<i64> ward_chain(feature_matrix<T, Alloc> const &m, segment span, size_t k) {
  struct cluster {
    size_t start;
    size_t size;
    std::vector<double> mean;
  };

  size_t const nfeat = m.nfeat();

  std::vector<cluster> clusters;
  clusters.reserve(span.size);
  for (size_t t = 0; t < span.size; ++t) {
    cluster c{t, 1, std::vector<double>(nfeat)};
    for (size_t r = 0; r < nfeat; ++r) {
      c.mean[r] = static_cast<double>(m.at(r, span.offset + t));
    }
    clusters.push_back(std::move(c));
  }

  auto merge_cost = [nfeat](cluster const &a, cluster const &b) {
    double dist = 0.0;
    for (size_t r = 0; r < nfeat; ++r) {
      double const d = a.mean[r] - b.mean[r];
      dist += d * d;
    }
    auto const na = static_cast<double>(a.size);
    auto const nb = static_cast<double>(b.size);
    return na * nb / (na + nb) * dist;
  };

  // cost[i] is the cost of merging clusters i and i + 1
  std::vector<double> cost;
  cost.reserve(clusters.size());
  for (size_t i = 0; i + 1 < clusters.size(); ++i) {
    cost.push_back(merge_cost(clusters[i], clusters[i + 1]));
  }

  while (clusters.size() > k) {
    auto const best = static_cast<size_t>(std::ranges::min_element(cost) - cost.begin());

    auto &a = clusters[best];
    auto const &b = clusters[best + 1];
    auto const na = static_cast<double>(a.size);
    auto const nb = static_cast<double>(b.size);
    for (size_t r = 0; r < nfeat; ++r) {
      a.mean[r] = (na * a.mean[r] + nb * b.mean[r]) / (na + nb);
    }
    a.size += b.size;

    clusters.erase(clusters.begin() + static_cast<std::ptrdiff_t>(best) + 1);
    cost.erase(cost.begin() + static_cast<std::ptrdiff_t>(best));

    if (best > 0) {
      cost[best - 1] = merge_cost(clusters[best - 1], clusters[best]);
    }
    if (best < cost.size()) {
      cost[best] = merge_cost(clusters[best], clusters[best + 1]);
    }
  }

  std::vector<i64> edges;
  edges.reserve(clusters.size());
  for (auto const &c : clusters) {
    edges.push_back(static_cast<i64>(c.start));
  }
  return edges;
}
} // namespace detail

/**
 * @brief Partition the frames of m into k contiguous clusters
 *
 * @return k strictly increasing left edges, the first one 0
 * @throws std::invalid_argument if k is 0 or exceeds the number of frames
 */
template <typename T, typename Alloc>
std::vector<i64> agglomerative(feature_matrix<T, Alloc> const &m, size_t k) {
  if (k < 1 || k > m.nframe()) {
    throw std::invalid_argument("agglomerative: k must be in [1, " + std::to_string(m.nframe()) + "], got " +
                                std::to_string(k));
  }
  return detail::ward_chain(m, segment{0, m.nframe()}, k);
}

/**
 * @brief Split every segment between consecutive frames into up to n_segments sub-segments
 *
 * frames is normalised with fix_frames(frames, 0, T) first. Each segment [s, e) is clustered with
 * agglomerative() into min(e - s, n_segments) runs, whose left edges are returned offset by s.
 *
 * The result is strictly increasing and starts at 0; pass it through fix_frames before sync() to close the last
 * segment at T.
 *
 * @throws std::invalid_argument if n_segments is 0 or m is empty
 * @throws invalid_boundary on negative frames
 */
template <typename T, typename Alloc, range_of<i64> R>
std::vector<i64> subsegment(feature_matrix<T, Alloc> const &m, R const &frames, size_t n_segments = 4) {
  if (n_segments < 1) {
    throw std::invalid_argument("subsegment: n_segments must be positive");
  }
  if (m.empty()) {
    throw std::invalid_argument("subsegment: input matrix is empty");
  }

  auto const segs = index_to_segments(frames, 0, static_cast<i64>(m.nframe()), true);

  std::vector<i64> out;
  for (auto const &s : segs) {
    auto const edges = detail::ward_chain(m, s, std::min(s.size, n_segments));
    for (auto e : edges) {
      out.push_back(static_cast<i64>(s.offset) + e);
    }
  }

  FRAMESYNC_LOG_DEBUG("subsegment: " << segs.size() << " segment(s) split into " << out.size() << " sub-segment(s)");
  return out;
}
} // namespace framesync
