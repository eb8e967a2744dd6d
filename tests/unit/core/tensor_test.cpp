#include <vigil/core/tensor.hpp>
#include <gtest/gtest.h>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace vc = vigil::core;

TEST(Tensor, ZeroFilledFromShape) {
  vc::Tensor t(std::vector<std::int64_t>{1, 3, 4});
  EXPECT_EQ(t.rank(), 3u);
  EXPECT_EQ(t.size(), 12u);
  EXPECT_EQ(t.dim(1), 3);
  EXPECT_EQ(t.dim(5), 0);
  for (float v : t.data()) EXPECT_EQ(v, 0.f);
}

TEST(Tensor, RejectsNegativeDim) {
  EXPECT_THROW(vc::Tensor(std::vector<std::int64_t>{1, -1, 4}), std::invalid_argument);
}

TEST(Tensor, RejectsValueCountMismatch) {
  EXPECT_THROW(vc::Tensor(std::vector<std::int64_t>{2, 2}, std::vector<float>{1.f, 2.f, 3.f}),
               std::invalid_argument);
}

TEST(Tensor, AtIsRowMajor) {
  vc::Tensor t(std::vector<std::int64_t>{2, 3}, std::vector<float>{0, 1, 2, 3, 4, 5});
  EXPECT_EQ(t.at({0, 2}), 2.f);
  EXPECT_EQ(t.at({1, 0}), 3.f);
  t.at({1, 2}) = 9.f;
  EXPECT_EQ(t.data()[5], 9.f);
}

TEST(Tensor, AtThrowsOutOfRange) {
  vc::Tensor t(std::vector<std::int64_t>{2, 3});
  EXPECT_THROW((void)t.at({2, 0}), std::out_of_range);
  EXPECT_THROW((void)t.at({0}), std::out_of_range);
}

TEST(Tensor, ElementCount) {
  const std::vector<std::int64_t> fixed{1, 3, 416, 416};
  const std::vector<std::int64_t> dynamic{-1, 3, 416, 416};
  const std::vector<std::int64_t> scalar;
  EXPECT_EQ(vc::Tensor::element_count(fixed), 3u * 416u * 416u);
  EXPECT_EQ(vc::Tensor::element_count(dynamic), 0u);
  EXPECT_EQ(vc::Tensor::element_count(scalar), 1u);
}

TEST(Tensor, RankZeroHoldsOneValue) {
  vc::Tensor t(std::vector<std::int64_t>{}, std::vector<float>{2.5f});
  EXPECT_EQ(t.rank(), 0u);
  ASSERT_EQ(t.size(), 1u);
  EXPECT_FLOAT_EQ(t.at({}), 2.5f);
  EXPECT_THROW((vc::Tensor(std::vector<std::int64_t>{}, std::vector<float>{})),
               std::invalid_argument);
}

TEST(Tensor, ShapeToString) {
  const std::vector<std::int64_t> shape{1, 3, 416, 416};
  EXPECT_EQ(vc::shape_to_string(shape), "[1,3,416,416]");
}
