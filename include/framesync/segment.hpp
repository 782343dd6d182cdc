#pragma once

#include <cstddef>
#include <ostream>

namespace framesync {

/**
 * @brief Half-open span of frames [offset, offset + size)
 */
struct segment {
  size_t offset; ///< First frame of the segment
  size_t size;   ///< Number of frames in the segment

  constexpr size_t end() const noexcept { return offset + size; }
  constexpr bool empty() const noexcept { return size == 0; }

  friend bool operator==(segment const &lhs, segment const &rhs) noexcept = default;

  friend std::ostream &operator<<(std::ostream &os, segment const &s) {
    return os << '[' << s.offset << ", " << s.end() << ')';
  }
};
} // namespace framesync
