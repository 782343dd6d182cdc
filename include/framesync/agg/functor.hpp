#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <ranges>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "../common.hpp"
#include "../def.hpp"
#include "../reducer_base.hpp"

namespace framesync::agg {
/**
 * @brief Read-only view of one segment handed to a callable reducer
 */
template <typename T>
class segment_view {
public:
  segment_view(size_t num_frames, size_t num_rows, T const *const *rows) noexcept
      : n(num_frames), m(num_rows), in(rows) {}

  size_t size() const noexcept { return n; }
  size_t num_features() const noexcept { return m; }

  std::span<T const> row(size_t r) const noexcept { return {in[r], n}; }
  T const &operator()(size_t r, size_t i) const noexcept { return in[r][i]; }

private:
  size_t n;
  size_t m;
  T const *const *in;
};

template <typename Fn, typename T>
concept segment_callable =
    std::invocable<Fn &, segment_view<T>> && sized_range_of<std::invoke_result_t<Fn &, segment_view<T>>, T>;

/**
 * @brief Adapts a callable `segment_view<T> -> range of T` into a reducer
 *
 * The callable must return exactly one value per feature row, any other length is reported as a failure of the
 * reducer.
 */
template <typename T, segment_callable<T> Fn>
class functor : public reducer_base<T> {
public:
  using data_type = T;

  explicit functor(Fn f = Fn{}) : fn(std::move(f)) {}

  void on_data(size_t n, size_t m, data_type const *const *in, data_type *out) override {
    auto const result = fn(segment_view<data_type>(n, m, in));
    auto const got = static_cast<size_t>(std::ranges::size(result));
    if (got != m) {
      throw std::length_error("functor: reducer returned " + std::to_string(got) + " values, expected " +
                              std::to_string(m));
    }
    std::ranges::copy(result, out);
  }

  FRAMESYNC_CLONEABLE(functor)

private:
  FRAMESYNC_NO_UNIQUE_ADDRESS Fn fn;
};

template <typename T, typename Fn>
auto make_functor(Fn &&fn) {
  return functor<T, std::decay_t<Fn>>(std::forward<Fn>(fn));
}
} // namespace framesync::agg
