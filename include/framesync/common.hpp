#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <ranges>
#include <type_traits>

namespace framesync {
using i64 = int64_t; ///< Frame index type, signed so raw tracker output can be validated

// Concepts

template <typename R, typename U>
concept range_of = std::ranges::forward_range<R> && std::convertible_to<std::ranges::range_value_t<R>, U>;

template <typename R, typename U>
concept sized_range_of = range_of<R, U> && std::ranges::sized_range<R>;

template <typename T>
concept arithmetic = std::is_arithmetic_v<T>;
} // namespace framesync
