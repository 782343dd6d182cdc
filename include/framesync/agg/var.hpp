#pragma once

#include <algorithm>
#include <cmath>
#include <concepts>
#include <numeric>
#include <span>
#include <stdexcept>

#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
template <std::floating_point Data>
struct stddev : public reducer_base<Data> {
  using data_type = Data;

  size_t const ddof;

  // Population standard deviation by default, pass 1 for the sample estimate
  explicit stddev(size_t degrees_of_freedom = 0) : ddof(degrees_of_freedom) {}

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    if (n <= ddof) {
      throw std::domain_error("stddev: segment has no more frames than degrees of freedom");
    }
    if (n == 1) {
      std::fill_n(out, m, data_type{0});
      return;
    }

    for (size_t i = 0; i < m; ++i) {
      std::span<data_type const> row(in[i], n);
      auto mean = std::accumulate(row.begin(), row.end(), data_type{}) / static_cast<data_type>(n);

      data_type sum_sq_diff{};
      for (auto v : row) {
        data_type diff = v - mean;
        sum_sq_diff += diff * diff;
      }
      out[i] = std::sqrt(sum_sq_diff / static_cast<data_type>(n - ddof));
    }
  }

  FRAMESYNC_CLONEABLE(stddev)
};
} // namespace framesync::agg
