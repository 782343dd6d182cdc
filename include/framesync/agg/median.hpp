#pragma once

#include <algorithm>
#include <concepts>
#include <vector>

#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
/**
 * @brief Per-row median of a segment.
 *
 * Even-length segments yield the mean of the two middle values, so Data must be floating point.
 */
template <std::floating_point Data>
struct median : public reducer_base<Data> {
  using data_type = Data;

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    buf.resize(n);
    auto const mid = buf.begin() + static_cast<std::ptrdiff_t>(n / 2);
    for (size_t i = 0; i < m; ++i) {
      std::copy_n(in[i], n, buf.begin());
      std::nth_element(buf.begin(), mid, buf.end());
      if (n % 2 == 1) {
        out[i] = *mid;
      } else {
        // upper middle is in place, lower middle is the largest of the left partition
        auto const lower = *std::max_element(buf.begin(), mid);
        out[i] = (lower + *mid) / data_type{2};
      }
    }
  }

  FRAMESYNC_CLONEABLE(median)

private:
  std::vector<data_type> buf; ///< Reused selection buffer
};
} // namespace framesync::agg
