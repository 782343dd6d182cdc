#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace framesync {
/// Boundary out of range, not strictly increasing, negative frame, or an empty/out-of-range segment.
class invalid_boundary : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// Boundary list does not describe a single segment.
class insufficient_boundaries : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * @brief A reducer failed on a segment.
 *
 * The exception raised by the reducer is attached as a nested exception, retrieve it with
 * std::rethrow_if_nested.
 */
class reducer_error : public std::runtime_error {
public:
  reducer_error(size_t segment_index, std::string const &what) : std::runtime_error(what), seg(segment_index) {}

  size_t segment_index() const noexcept { return seg; }

private:
  size_t seg;
};
} // namespace framesync
