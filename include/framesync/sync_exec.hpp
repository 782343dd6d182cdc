#pragma once

#include <algorithm>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "error.hpp"
#include "logging.hpp"
#include "matrix.hpp"
#include "reducer_base.hpp"
#include "segment.hpp"

#include "detail/lane_store.hpp"
#include "detail/reducer_store.hpp"

namespace framesync {

/**
 * @brief Segment aggregation executor
 *
 * Reduces every segment of a feature matrix to one output column. Segments are independent, so they can be split
 * across worker threads:
 * - each worker owns a clone of the reducer and its own cache-line aligned scratch lanes
 * - worker w processes one contiguous block of segment indices and writes only the matching output columns
 * - the output is identical for every worker count
 *
 * If reductions fail, all workers still finish and are joined, then the failure with the lowest segment index is
 * raised as reducer_error with the original exception nested. No partial output is returned.
 *
 * A single sync_exec must not run() concurrently from several threads.
 *
 * Usage:
 * 1. Construct with a reducer prototype and the number of workers
 * 2. Call run() with a matrix and a list of segments, as often as needed
 *
 * @tparam T Element type
 * @tparam Alloc Allocator type for internal storage
 */
template <arithmetic T, typename Alloc = std::allocator<T>>
class sync_exec {
public:
  using data_type = T;
  using reducer_type = reducer_base<data_type>;

  /**
   * @param reducer   Prototype, cloned once per worker
   * @param n_workers Number of workers, 0 selects std::thread::hardware_concurrency()
   * @param alloc     Allocator for internal storage
   */
  explicit sync_exec(reducer_type const &reducer, size_t n_workers = 1, Alloc alloc = Alloc{})
      : nwork(resolve_workers(n_workers)), reducers(reducer, nwork, alloc), alloc(alloc) {}

  /**
   * @brief Reduce each segment of m into one column
   *
   * @param m    Input matrix, D x T with D, T > 0
   * @param segs Segments, each non-empty and inside [0, T)
   * @return D x segs.size() matrix, column i reduces segs[i]
   * @throws insufficient_boundaries if segs is empty
   * @throws invalid_boundary if a segment is empty or reaches past the last frame
   * @throws reducer_error if the reducer fails on any segment
   */
  template <typename MAlloc>
  feature_matrix<data_type, MAlloc> run(feature_matrix<data_type, MAlloc> const &m, std::span<segment const> segs) {
    check_input(m, segs);

    size_t const nfeat = m.nfeat();
    size_t const nseg = segs.size();
    size_t const nthread = std::min(nwork, nseg);

    feature_matrix<data_type, MAlloc> out(nfeat, nseg, data_type{}, m.get_allocator());
    detail::lane_store<data_type const *, detail::rebind_alloc<Alloc, data_type const *>> args(nfeat, nthread, alloc);
    detail::lane_store<data_type, Alloc> result(nfeat, nthread, alloc);
    std::vector<failure> failures(nthread);

    FRAMESYNC_LOG_DEBUG("sync_exec: " << nseg << " segment(s), " << nfeat << " feature(s), " << m.nframe()
                                      << " frame(s), " << nthread << " worker(s)");

    auto block = [&](size_t iworker) {
      size_t const first = nseg * iworker / nthread;
      size_t const last = nseg * (iworker + 1) / nthread;
      run_block(iworker, first, last, m, segs, out, args[iworker], result[iworker], failures[iworker]);
    };

    if (nthread == 1) {
      block(0);
    } else {
      std::vector<std::jthread> pool;
      pool.reserve(nthread - 1);
      for (size_t iworker = 1; iworker < nthread; ++iworker) {
        pool.emplace_back(block, iworker);
      }
      block(0);
      // jthread joins on destruction
      pool.clear();
    }

    for (auto const &f : failures) {
      if (f.error) {
        raise(f);
      }
    }
    return out;
  }

  size_t num_workers() const noexcept { return nwork; }

private:
  struct failure {
    size_t index = 0;
    std::exception_ptr error;
    std::string what;
  };

  static size_t resolve_workers(size_t n) noexcept {
    if (n != 0) {
      return n;
    }
    auto const hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
  }

  template <typename MAlloc>
  static void check_input(feature_matrix<data_type, MAlloc> const &m, std::span<segment const> segs) {
    if (m.nfeat() == 0 || m.nframe() == 0) {
      throw std::invalid_argument("sync_exec: input matrix is empty");
    }
    if (segs.empty()) {
      throw insufficient_boundaries("sync_exec: no segments to aggregate");
    }
    for (size_t i = 0; i < segs.size(); ++i) {
      auto const &s = segs[i];
      if (s.empty()) {
        throw invalid_boundary("sync_exec: segment " + std::to_string(i) + " is empty");
      }
      if (s.offset >= m.nframe() || s.size > m.nframe() - s.offset) {
        throw invalid_boundary("sync_exec: segment " + std::to_string(i) + " ends at frame " +
                               std::to_string(s.end()) + ", past the last frame " + std::to_string(m.nframe()));
      }
    }
  }

  template <typename MAlloc>
  void run_block(size_t iworker, size_t first, size_t last, feature_matrix<data_type, MAlloc> const &m,
                 std::span<segment const> segs, feature_matrix<data_type, MAlloc> &out,
                 std::span<data_type const *> in, std::span<data_type> col, failure &fail) {
    auto &reducer = reducers[iworker];
    size_t const nfeat = m.nfeat();

    for (size_t i = first; i < last; ++i) {
      auto const &s = segs[i];
      for (size_t r = 0; r < nfeat; ++r) {
        in[r] = m[r].data() + s.offset;
      }

      try {
        reducer.on_data(s.size, nfeat, in.data(), col.data());
      } catch (std::exception const &e) {
        fail = {i, std::current_exception(), e.what()};
        return;
      } catch (...) {
        fail = {i, std::current_exception(), "unknown exception"};
        return;
      }

      for (size_t r = 0; r < nfeat; ++r) {
        out.at(r, i) = col[r];
      }
    }
  }

  [[noreturn]] static void raise(failure const &f) {
    std::string const msg = "reducer failed on segment " + std::to_string(f.index) + ": " + f.what;
    FRAMESYNC_LOG_WARN(msg);
    try {
      std::rethrow_exception(f.error);
    } catch (...) {
      std::throw_with_nested(reducer_error(f.index, msg));
    }
  }

  size_t nwork;
  detail::reducer_store<data_type, Alloc> reducers;
  Alloc alloc;
};

} // namespace framesync
