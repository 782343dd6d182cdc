#pragma once

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "framesync/reducer_base.hpp"

#include "arena.hpp"
#include "utils.hpp"

namespace framesync::detail {
/**
 * @brief One private reducer instance per worker, cloned from a prototype into a single arena
 *
 * Memory layout:
 * | PADDING | reducer 0 | PADDING | reducer 1 | ... | reducer n-1 |
 *
 * Every clone starts on its own cache line, each worker only touches its own clone.
 */
template <typename T, typename Alloc = std::allocator<T>>
class reducer_store {
  using byte_alloc = rebind_alloc<Alloc, std::byte>;
  std::vector<std::byte, byte_alloc> arena_storage;
  arena_resource arena;

public:
  using data_type = T;
  using base_type = reducer_base<data_type>;
  using node_type = std::unique_ptr<base_type, arena_deleter<base_type>>;

  reducer_store(base_type const &proto, size_t n_workers, Alloc alloc = Alloc{})
      : arena_storage(byte_alloc{alloc}), arena(nullptr, 0), nodes() {
    if (n_workers == 0) {
      throw std::invalid_argument("Number of workers must be greater than 0.");
    }

    size_t const align = std::max(cacheline_size, proto.clone_align());
    size_t const slot = aligned_size(proto.clone_size(), align);

    // add extra align to ensure the first slot fits after aligning the buffer start
    arena_storage.resize(slot * n_workers + align);
    arena = arena_resource(arena_storage.data(), arena_storage.size());

    nodes.reserve(n_workers);
    for (size_t i = 0; i < n_workers; ++i) {
      void *mem = arena.allocate(proto.clone_size(), align);
      nodes.emplace_back(proto.clone_at(mem));
    }
  }

  reducer_store(reducer_store const &) = delete;
  reducer_store &operator=(reducer_store const &) = delete;

  base_type &operator[](size_t iworker) noexcept { return *nodes[iworker]; }

  size_t size() const noexcept { return nodes.size(); }

private:
  std::vector<node_type> nodes; ///< clones, size = n_workers
};
} // namespace framesync::detail
