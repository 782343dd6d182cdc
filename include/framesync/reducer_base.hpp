#pragma once

#include <cstddef>

namespace framesync {
/**
 * @brief Base class for segment reducers
 *
 * Contract:
 *
 * 1. Reduces one segment (m feature rows x n frames) into a single column of m values.
 * 2. Input: in[r][i] is the i-th frame of feature row r inside the segment.
 * 3. Output: out[r] receives the reduced value of feature row r.
 * 4. n and m are guaranteed to be greater than 0.
 * 5. Reducers are not required to be thread-safe; executors clone one per worker.
 * 6. A reducer may throw to signal failure. The executor reports it as reducer_error.
 * 7. Executor guarantees non-aliased in and out pointers.
 *
 * @see framesync::agg::avg for a reference implementation.
 * @see framesync::agg::functor for adapting arbitrary callables.
 */
template <typename Data>
struct reducer_base {
  using data_type = Data;

  /**
   * @brief Reduce a segment
   *
   * @param n   number of frames in the segment
   * @param m   number of feature rows
   * @param in  pointer to the row pointers, index dimension: (row, frame)
   * @param out pointer to the output column, index dimension: (row)
   */
  virtual void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) = 0;

  virtual reducer_base *clone_at(void *mem) const = 0;
  virtual size_t clone_size() const noexcept = 0;
  virtual size_t clone_align() const noexcept = 0;

  virtual ~reducer_base() noexcept = default;
};
} // namespace framesync
