#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "framesync/matrix.hpp"

namespace {
using namespace framesync;

class FeatureMatrixTest : public ::testing::Test {
protected:
  void SetUp() override {}
  void TearDown() override {}
};

// Test basic construction and properties
TEST_F(FeatureMatrixTest, BasicConstruction) {
  feature_matrix<double> m(4); // 4 features, no frames

  EXPECT_EQ(m.nfeat(), 4);
  EXPECT_EQ(m.nframe(), 0);
  EXPECT_EQ(m.size(), 0);
  EXPECT_TRUE(m.empty());
  EXPECT_EQ(m.frame_capacity(), 0);
}

TEST_F(FeatureMatrixTest, FilledConstruction) {
  feature_matrix<double> m(2, 3, 1.5);

  EXPECT_EQ(m.nfeat(), 2);
  EXPECT_EQ(m.nframe(), 3);
  EXPECT_EQ(m.size(), 6);
  for (size_t r = 0; r < 2; ++r) {
    for (size_t t = 0; t < 3; ++t) {
      EXPECT_DOUBLE_EQ(m.at(r, t), 1.5);
    }
  }
}

TEST_F(FeatureMatrixTest, RowsConstruction) {
  feature_matrix<int> m{{1, 2, 3}, {4, 5, 6}};

  EXPECT_EQ(m.nfeat(), 2);
  EXPECT_EQ(m.nframe(), 3);

  auto row1 = m[1];
  ASSERT_EQ(row1.size(), 3);
  EXPECT_EQ(row1[0], 4);
  EXPECT_EQ(row1[2], 6);
}

TEST_F(FeatureMatrixTest, RaggedRowsRejected) {
  EXPECT_THROW((feature_matrix<int>{{1, 2, 3}, {4, 5}}), std::invalid_argument);
}

TEST_F(FeatureMatrixTest, FramesConstruction) {
  auto m = feature_matrix<double>::from_frames({{0, 10}, {2, 12}, {4, 14}});

  EXPECT_EQ(m.nfeat(), 2);
  EXPECT_EQ(m.nframe(), 3);
  EXPECT_EQ(m, (feature_matrix<double>{{0, 2, 4}, {10, 12, 14}}));
}

// Test append keeps rows contiguous across reallocation
TEST_F(FeatureMatrixTest, AppendFrames) {
  feature_matrix<int> m(3);

  for (int t = 0; t < 10; ++t) {
    std::vector<int> frame = {t, 10 * t, 100 * t};
    m.append(frame);
  }

  EXPECT_EQ(m.nframe(), 10);
  EXPECT_GE(m.frame_capacity(), 10);

  auto row2 = m[2];
  ASSERT_EQ(row2.size(), 10);
  for (int t = 0; t < 10; ++t) {
    EXPECT_EQ(row2[t], 100 * t);
    EXPECT_EQ(m.at(1, t), 10 * t);
  }
}

TEST_F(FeatureMatrixTest, AppendWrongSizeThrows) {
  feature_matrix<int> m(3);
  std::vector<int> frame = {1, 2};
  EXPECT_THROW(m.append(frame), std::invalid_argument);
  EXPECT_EQ(m.nframe(), 0);
}

TEST_F(FeatureMatrixTest, ReservePreservesData) {
  feature_matrix<int> m{{1, 2}, {3, 4}};
  m.reserve(50);

  EXPECT_EQ(m.frame_capacity(), 50);
  EXPECT_EQ(m, (feature_matrix<int>{{1, 2}, {3, 4}}));
}

TEST_F(FeatureMatrixTest, ColumnExtraction) {
  feature_matrix<int> m{{1, 2, 3}, {4, 5, 6}};

  EXPECT_EQ(m.column(0), (std::vector<int>{1, 4}));
  EXPECT_EQ(m.column(2), (std::vector<int>{3, 6}));
}

TEST_F(FeatureMatrixTest, Transpose) {
  feature_matrix<int> m{{1, 2, 3}, {4, 5, 6}};
  auto t = m.transpose();

  EXPECT_EQ(t.nfeat(), 3);
  EXPECT_EQ(t.nframe(), 2);
  EXPECT_EQ(t, (feature_matrix<int>{{1, 4}, {2, 5}, {3, 6}}));
  EXPECT_EQ(t.transpose(), m);
}

TEST_F(FeatureMatrixTest, EqualityIgnoresCapacity) {
  feature_matrix<int> a{{1, 2}, {3, 4}};
  feature_matrix<int> b(2);
  b.reserve(16);
  b.append(std::vector<int>{1, 3});
  b.append(std::vector<int>{2, 4});

  EXPECT_EQ(a, b);

  b.at(1, 1) = 5;
  EXPECT_NE(a, b);
}

TEST_F(FeatureMatrixTest, ClearKeepsFeatures) {
  feature_matrix<int> m{{1, 2}, {3, 4}};
  m.clear();

  EXPECT_EQ(m.nfeat(), 2);
  EXPECT_EQ(m.nframe(), 0);
  EXPECT_TRUE(m.empty());
}

TEST_F(FeatureMatrixTest, StreamOutput) {
  feature_matrix<int> m{{1, 2}, {3, 4}};
  std::ostringstream os;
  os << m;
  EXPECT_EQ(os.str(), "feature_matrix(2x2)\n  [1, 2]\n  [3, 4]");
}
} // namespace
