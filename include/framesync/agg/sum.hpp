#pragma once

#include <numeric>
#include <span>

#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
template <typename Data>
struct sum : public reducer_base<Data> {
  using data_type = Data;

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    for (size_t i = 0; i < m; ++i) {
      std::span<data_type const> row(in[i], n);
      out[i] = std::accumulate(row.begin(), row.end(), data_type{});
    }
  }

  FRAMESYNC_CLONEABLE(sum)
};
} // namespace framesync::agg
