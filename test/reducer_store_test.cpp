#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <stdexcept>

#include "framesync/agg/avg.hpp"
#include "framesync/def.hpp"
#include "framesync/detail/reducer_store.hpp"

namespace {
using namespace framesync;

namespace {
// Counts calls so that clones can be told apart
struct counting : public reducer_base<double> {
  size_t calls = 0;

  void on_data(size_t, size_t m, double const *const *, double *out) override {
    ++calls;
    std::fill_n(out, m, static_cast<double>(calls));
  }

  FRAMESYNC_CLONEABLE(counting)
};

struct fails_to_clone : public reducer_base<double> {
  void on_data(size_t, size_t, double const *const *, double *) override {}

  fails_to_clone *clone_at(void *) const override { throw std::runtime_error("no copies"); }
  size_t clone_size() const noexcept override { return sizeof(fails_to_clone); }
  size_t clone_align() const noexcept override { return alignof(fails_to_clone); }
};
} // namespace

TEST(ReducerStore, OneClonePerWorker) {
  counting proto;
  proto.calls = 7;
  detail::reducer_store<double> store(proto, 3);

  ASSERT_EQ(store.size(), 3);
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(static_cast<counting &>(store[i]).calls, 7);
    EXPECT_NE(&store[i], static_cast<reducer_base<double> *>(&proto));
  }
}

TEST(ReducerStore, ClonesAreIndependent) {
  counting proto;
  detail::reducer_store<double> store(proto, 2);

  double out = 0.0;
  store[0].on_data(1, 1, nullptr, &out);
  store[0].on_data(1, 1, nullptr, &out);
  EXPECT_DOUBLE_EQ(out, 2.0);

  store[1].on_data(1, 1, nullptr, &out);
  EXPECT_DOUBLE_EQ(out, 1.0);
  EXPECT_EQ(proto.calls, 0);
}

TEST(ReducerStore, ClonesStartOnSeparateCachelines) {
  agg::avg<double> proto;
  detail::reducer_store<double> store(proto, 4);
  for (size_t i = 0; i < 4; ++i) {
    auto addr = reinterpret_cast<std::uintptr_t>(&store[i]);
    EXPECT_EQ(addr % detail::cacheline_size, 0u) << "worker " << i;
  }
}

TEST(ReducerStore, ZeroWorkersRejected) {
  agg::avg<double> proto;
  EXPECT_THROW(detail::reducer_store<double>(proto, 0), std::invalid_argument);
}

TEST(ReducerStore, CloneFailurePropagates) {
  fails_to_clone proto;
  EXPECT_THROW(detail::reducer_store<double>(proto, 2), std::runtime_error);
}
} // namespace
