#pragma once

#include <algorithm>
#include <span>

#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
template <typename Data>
struct max : public reducer_base<Data> {
  using data_type = Data;

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    for (size_t i = 0; i < m; ++i) {
      std::span<data_type const> row(in[i], n);
      out[i] = *std::ranges::max_element(row);
    }
  }

  FRAMESYNC_CLONEABLE(max)
};

template <typename Data>
struct min : public reducer_base<Data> {
  using data_type = Data;

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    for (size_t i = 0; i < m; ++i) {
      std::span<data_type const> row(in[i], n);
      out[i] = *std::ranges::min_element(row);
    }
  }

  FRAMESYNC_CLONEABLE(min)
};
} // namespace framesync::agg
