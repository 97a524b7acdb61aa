#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <gtest/gtest.h>
#include <limits>

namespace cc = clashvision::core;

TEST(Box, AreaCenterDimensions) {
  const cc::Box b{10.f, 20.f, 50.f, 80.f, 0, 0.9f};
  EXPECT_FLOAT_EQ(b.area(), 2400.f);
  const auto [cx, cy] = b.center();
  EXPECT_FLOAT_EQ(cx, 30.f);
  EXPECT_FLOAT_EQ(cy, 50.f);
  const auto [w, h] = b.dimensions();
  EXPECT_FLOAT_EQ(w, 40.f);
  EXPECT_FLOAT_EQ(h, 60.f);
}

TEST(Box, FromCenter) {
  const cc::Box b = cc::Box::from_center(30.f, 50.f, 40.f, 60.f, 1, 0.5f);
  EXPECT_FLOAT_EQ(b.x1, 10.f);
  EXPECT_FLOAT_EQ(b.y1, 20.f);
  EXPECT_FLOAT_EQ(b.x2, 50.f);
  EXPECT_FLOAT_EQ(b.y2, 80.f);
  EXPECT_EQ(b.class_id, 1);
  EXPECT_FLOAT_EQ(b.confidence, 0.5f);
}

TEST(Box, IouOfPartialOverlap) {
  const cc::Box a{0.f, 0.f, 10.f, 10.f, 0, 0.9f};
  const cc::Box b{5.f, 5.f, 15.f, 15.f, 0, 0.8f};
  EXPECT_FLOAT_EQ(a.intersection(b), 25.f);
  EXPECT_FLOAT_EQ(a.union_area(b), 175.f);
  EXPECT_NEAR(a.iou(b), 25.f / 175.f, 1e-6f);
  EXPECT_FLOAT_EQ(a.iou(b), b.iou(a));
}

TEST(Box, IouIdenticalIsOne) {
  const cc::Box a{0.f, 0.f, 10.f, 10.f, 0, 0.9f};
  EXPECT_FLOAT_EQ(a.iou(a), 1.f);
}

TEST(Box, IouDisjointAndTouchingIsZero) {
  const cc::Box a{0.f, 0.f, 10.f, 10.f, 0, 0.9f};
  const cc::Box far{20.f, 20.f, 30.f, 30.f, 0, 0.9f};
  const cc::Box touching{10.f, 0.f, 20.f, 10.f, 0, 0.9f};
  EXPECT_FLOAT_EQ(a.iou(far), 0.f);
  EXPECT_FLOAT_EQ(a.iou(touching), 0.f);
}

TEST(Box, IouDegenerateIsZero) {
  const cc::Box point{5.f, 5.f, 5.f, 5.f, 0, 0.9f};
  const cc::Box a{0.f, 0.f, 10.f, 10.f, 0, 0.9f};
  EXPECT_FLOAT_EQ(point.iou(a), 0.f);
  EXPECT_FLOAT_EQ(point.iou(point), 0.f);
}

TEST(Box, Validity) {
  EXPECT_TRUE((cc::Box{0.f, 0.f, 1.f, 1.f, 0, 0.f}).is_valid());
  EXPECT_TRUE((cc::Box{0.f, 0.f, 1.f, 1.f, 0, 1.f}).is_valid());
  EXPECT_FALSE((cc::Box{1.f, 0.f, 1.f, 1.f, 0, 0.5f}).is_valid());
  EXPECT_FALSE((cc::Box{0.f, 2.f, 1.f, 1.f, 0, 0.5f}).is_valid());
  EXPECT_FALSE((cc::Box{0.f, 0.f, 1.f, 1.f, 0, 1.5f}).is_valid());
  EXPECT_FALSE((cc::Box{0.f, 0.f, 1.f, 1.f, 0, -0.1f}).is_valid());
  const float nan = std::numeric_limits<float>::quiet_NaN();
  EXPECT_FALSE((cc::Box{0.f, 0.f, 1.f, 1.f, 0, nan}).is_valid());
}

TEST(Box, ValidatedRejectsInvertedCorners) {
  auto ok = cc::Box::validated(0.f, 0.f, 4.f, 4.f, 1, 0.7f);
  ASSERT_TRUE(ok.has_value());
  EXPECT_EQ(ok->class_id, 1);

  auto bad = cc::Box::validated(4.f, 0.f, 0.f, 4.f, 1, 0.7f);
  ASSERT_FALSE(bad.has_value());
  EXPECT_EQ(bad.error(), cc::PipelineError::InvalidBox);
}

TEST(Box, Scaled) {
  const cc::Box b{10.f, 20.f, 30.f, 40.f, 1, 0.6f};
  const cc::Box s = b.scaled(2.f, 0.5f);
  EXPECT_FLOAT_EQ(s.x1, 20.f);
  EXPECT_FLOAT_EQ(s.x2, 60.f);
  EXPECT_FLOAT_EQ(s.y1, 10.f);
  EXPECT_FLOAT_EQ(s.y2, 20.f);
  EXPECT_EQ(s.class_id, 1);
  EXPECT_FLOAT_EQ(s.confidence, 0.6f);
}

TEST(PipelineError, NamesAreStable) {
  EXPECT_EQ(cc::error_name(cc::PipelineError::ImageLoadFailed), "ImageLoadFailed");
  EXPECT_EQ(cc::error_name(cc::PipelineError::ShapeMismatch), "ShapeMismatch");
  EXPECT_EQ(cc::error_name(cc::PipelineError::IoFailed), "IoFailed");
}
