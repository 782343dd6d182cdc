#pragma once

#include <algorithm>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <span>
#include <stdexcept>
#include <vector>

#include "common.hpp"

namespace framesync {
/**
 * @brief Dense feature matrix, D features x T frames
 *
 * Storage is feature-major: every feature row is contiguous over time, so a segment of frames is a set of D
 * contiguous slices that can be handed to a reducer without copying.
 *
 * Layout:
 * | row 0 (T frames) | remaining space | row 1 (T frames) | remaining space | ... | row D-1 (T frames) | ... |
 *
 * @tparam T Element type
 * @tparam Alloc Allocator for the underlying storage
 */
template <arithmetic T, typename Alloc = std::allocator<T>>
class feature_matrix {
public:
  using allocator_type = Alloc;
  using value_type = T;
  using size_type = std::size_t;

  /**
   * @brief Construct a matrix of num_frames frames filled with value
   *
   * @param num_features Number of feature rows (fixed for lifetime of object)
   * @param num_frames Initial number of frames
   * @param value Fill value
   * @param alloc Allocator instance
   */
  explicit feature_matrix(size_t num_features, size_t num_frames = 0, T value = T{}, Alloc const &alloc = Alloc{})
      : n_feat(num_features), storage(alloc), frame_cap(num_frames), n_frame(num_frames) {
    storage.assign(n_feat * frame_cap, value);
  }

  /**
   * @brief Construct from feature rows, each row holding one value per frame
   */
  feature_matrix(std::initializer_list<std::initializer_list<T>> rows, Alloc const &alloc = Alloc{})
      : feature_matrix(rows.size(), rows.size() == 0 ? 0 : rows.begin()->size(), T{}, alloc) {
    size_t r = 0;
    for (auto const &row : rows) {
      if (row.size() != n_frame) {
        throw std::invalid_argument("feature_matrix: rows must have equal length");
      }
      std::ranges::copy(row, storage.begin() + static_cast<std::ptrdiff_t>(idx(r++, 0)));
    }
  }

  /**
   * @brief Construct from frames, each frame holding one value per feature
   */
  static feature_matrix from_frames(std::initializer_list<std::initializer_list<T>> frames,
                                    Alloc const &alloc = Alloc{}) {
    size_t const n_features = frames.size() == 0 ? 0 : frames.begin()->size();
    feature_matrix m(n_features, 0, T{}, alloc);
    m.reserve(frames.size());
    for (auto const &frame : frames) {
      m.append(std::span<T const>(frame.begin(), frame.size()));
    }
    return m;
  }

  allocator_type get_allocator() const noexcept { return storage.get_allocator(); }

  /**
   * @brief Span over all frames of a feature row
   */
  std::span<T> operator[](size_t row) noexcept { return {storage.data() + row * frame_cap, n_frame}; }
  std::span<T const> operator[](size_t row) const noexcept { return {storage.data() + row * frame_cap, n_frame}; }

  T &at(size_t row, size_t frame) noexcept { return storage[idx(row, frame)]; }
  T const &at(size_t row, size_t frame) const noexcept { return storage[idx(row, frame)]; }

  /**
   * @brief Append a frame (one value per feature)
   *
   * @param frame Span containing exactly nfeat() elements
   */
  void append(std::span<T const> frame) {
    if (frame.size() != n_feat) {
      throw std::invalid_argument("feature_matrix: frame size does not match number of features");
    }

    if (n_frame >= frame_cap) {
      ensure_frame_capacity(frame_cap == 0 ? 1 : frame_cap * 2);
    }

    for (size_t row = 0; row < n_feat; ++row) {
      storage[idx(row, n_frame)] = frame[row];
    }
    ++n_frame;
  }

  /**
   * @brief Copy one frame out of the matrix
   */
  std::vector<T> column(size_t frame) const {
    std::vector<T> out(n_feat);
    for (size_t row = 0; row < n_feat; ++row) {
      out[row] = at(row, frame);
    }
    return out;
  }

  feature_matrix transpose() const {
    feature_matrix out(n_frame, n_feat, T{}, get_allocator());
    for (size_t row = 0; row < n_feat; ++row) {
      for (size_t frame = 0; frame < n_frame; ++frame) {
        out.at(frame, row) = at(row, frame);
      }
    }
    return out;
  }

  size_t nfeat() const noexcept { return n_feat; }
  size_t nframe() const noexcept { return n_frame; }
  size_t frame_capacity() const noexcept { return frame_cap; }
  size_t size() const noexcept { return n_feat * n_frame; }
  bool empty() const noexcept { return size() == 0; }

  void clear() noexcept { n_frame = 0; }

  void reserve(size_t new_capacity) {
    if (new_capacity > frame_cap) {
      ensure_frame_capacity(new_capacity);
    }
  }

  friend bool operator==(feature_matrix const &lhs, feature_matrix const &rhs) {
    if (lhs.n_feat != rhs.n_feat || lhs.n_frame != rhs.n_frame) {
      return false;
    }
    for (size_t row = 0; row < lhs.n_feat; ++row) {
      if (!std::ranges::equal(lhs[row], rhs[row])) {
        return false;
      }
    }
    return true;
  }

  friend std::ostream &operator<<(std::ostream &os, feature_matrix const &m) {
    os << "feature_matrix(" << m.n_feat << 'x' << m.n_frame << ')';
    for (size_t row = 0; row < m.n_feat; ++row) {
      os << "\n  [";
      for (size_t frame = 0; frame < m.n_frame; ++frame) {
        os << (frame ? ", " : "") << m.at(row, frame);
      }
      os << ']';
    }
    return os;
  }

private:
  size_t n_feat; // fixed at construction
  std::vector<T, Alloc> storage;
  size_t frame_cap; // current capacity per row
  size_t n_frame;   // current number of frames

  void ensure_frame_capacity(size_t new_cap) {
    if (new_cap <= frame_cap) {
      return;
    }

    std::vector<T, Alloc> new_storage(storage.get_allocator());
    new_storage.resize(n_feat * new_cap);

    for (size_t row = 0; row < n_feat; ++row) {
      for (size_t frame = 0; frame < n_frame; ++frame) {
        new_storage[row * new_cap + frame] = storage[row * frame_cap + frame];
      }
    }

    storage = std::move(new_storage);
    frame_cap = new_cap;
  }

  size_t idx(size_t row, size_t frame) const noexcept { return row * frame_cap + frame; }
};
} // namespace framesync
