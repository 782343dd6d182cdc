#pragma once

#include <concepts>
#include <numeric>
#include <span>

#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
template <std::floating_point Data>
struct avg : public reducer_base<Data> {
  using data_type = Data;

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    for (size_t i = 0; i < m; ++i) {
      std::span<data_type const> row(in[i], n);
      auto sum = std::accumulate(row.begin(), row.end(), data_type{});
      out[i] = sum / static_cast<data_type>(n);
    }
  }

  FRAMESYNC_CLONEABLE(avg)
};
} // namespace framesync::agg
