#pragma once

#include <cstdint>
#include <memory_resource>
#include <new>

#include "utils.hpp"

namespace framesync::detail {
/**
 * @brief Monotonic memory resource over a caller-owned buffer
 *
 * Memory is never returned to the buffer; objects placed here are destroyed with arena_deleter and the storage is
 * reclaimed when the owning buffer goes away.
 */
class arena_resource : public std::pmr::memory_resource {
  std::byte *curr_;
  std::byte *end_;

public:
  arena_resource(void *buffer, std::size_t capacity) noexcept
      : curr_(static_cast<std::byte *>(buffer)), end_(curr_ + capacity) {}

protected:
  void *do_allocate(std::size_t bytes, std::size_t alignment) override {
    auto uptr = reinterpret_cast<uintptr_t>(curr_);
    auto aligned = reinterpret_cast<std::byte *>(aligned_size(uptr, alignment));
    auto new_curr = aligned + bytes;
    if (new_curr > end_) {
      throw std::bad_alloc();
    }
    curr_ = new_curr;
    return aligned;
  }

  void do_deallocate(void *, std::size_t, std::size_t) noexcept override {}

  bool do_is_equal(std::pmr::memory_resource const &other) const noexcept override { return this == &other; }
};

template <typename T>
struct arena_deleter {
  void operator()(T *ptr) const noexcept {
    // storage belongs to the arena, only run the destructor
    ptr->~T();
  }
};
} // namespace framesync::detail
