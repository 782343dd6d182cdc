#pragma once

#include <array>
#include <cassert>
#include <memory>
#include <span>
#include <vector>

#include "utils.hpp"

namespace framesync::detail {

/**
 * @brief Per-worker scratch storage, one cache-line aligned lane per worker.
 *
 * Provides n lanes of m elements each. Every lane starts on its own cache line so that workers writing to their
 * lanes never share a line.
 *
 * Layout:
 * | lane 0 (m elements) | padding | lane 1 (m elements) | padding | ... | lane n-1 (m elements) |
 *
 * @tparam T Element type, must be trivial
 * @tparam Allocator Allocator for the underlying storage
 */
template <trivial T, typename Allocator = std::allocator<T>>
class lane_store {
  struct alignas(cacheline_size) cacheline_chunk {
    std::array<std::byte, cacheline_size> data;
  };

  using chunk_allocator_type = rebind_alloc<Allocator, cacheline_chunk>;

public:
  using value_type = T;
  using size_type = std::size_t;

  lane_store(size_type lane_size, size_type num_lanes, Allocator const &alloc = Allocator{})
      : storage(chunk_allocator_type{alloc}), n_elem(lane_size), n_lane(num_lanes),
        stride(aligned_size(lane_size * sizeof(T), cacheline_size)) {
    assert(num_lanes > 0 && "[BUG] lane_store requires at least one lane.");
    storage.resize((n_lane * stride + cacheline_size - 1) / cacheline_size);
    for (size_type lane = 0; lane < n_lane; ++lane) {
      T *p = lane_data(lane);
      for (size_type i = 0; i < n_elem; ++i) {
        new (p + i) T{};
      }
    }
  }

  std::span<T> operator[](size_type lane) noexcept { return {lane_data(lane), n_elem}; }
  std::span<T const> operator[](size_type lane) const noexcept { return {lane_data(lane), n_elem}; }

  size_type lane_size() const noexcept { return n_elem; }
  size_type num_lanes() const noexcept { return n_lane; }
  size_type lane_stride() const noexcept { return stride; }

private:
  T *lane_data(size_type lane) const noexcept {
    assert(lane < n_lane && "[BUG] Lane index out of range.");
    auto bytes = lane * stride;
    auto *chunk = const_cast<cacheline_chunk *>(storage.data()) + (bytes >> cacheline_shift);
    return reinterpret_cast<T *>(chunk->data.data() + (bytes & cacheline_mask));
  }

  std::vector<cacheline_chunk, chunk_allocator_type> storage;
  size_type n_elem;
  size_type n_lane;
  size_type stride; // bytes between the start of consecutive lanes
};

} // namespace framesync::detail
