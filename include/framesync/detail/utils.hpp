#pragma once

#include <bit>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>

namespace framesync::detail {
constexpr inline size_t aligned_size(size_t size, size_t align) noexcept { return (size + align - 1) & ~(align - 1); }

#if defined(__cpp_lib_hardware_interference_size) && __cpp_lib_hardware_interference_size >= 201703L
// std::hardware_destructive_interference_size reports 64 for Apple Silicon as of Apple clang version 17.0.0
// (clang-1700.0.13.5), but 128 should be used as reported by sysctl: hw.cachelinesize: 128
#if defined(__APPLE__) && defined(__arm64__)
constexpr inline size_t cacheline_size = 128;
#else
constexpr inline size_t cacheline_size = std::hardware_destructive_interference_size;
#endif
#else
constexpr inline size_t cacheline_size = 64; // Default to 64 bytes
#endif

// Fast bit operations for cacheline size (which is always a power of 2)
constexpr inline size_t cacheline_shift = std::countr_zero(cacheline_size);
constexpr inline size_t cacheline_mask = cacheline_size - 1;

template <typename T>
concept trivial = std::is_trivial_v<T>;

template <typename Alloc, typename T>
using rebind_alloc = typename std::allocator_traits<Alloc>::template rebind_alloc<T>;
} // namespace framesync::detail
