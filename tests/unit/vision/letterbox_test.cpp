#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace cc = clashvision::core;
namespace vis = clashvision::vision;

namespace {

cc::ImageBuffer make_solid_rgb(std::uint32_t w, std::uint32_t h, std::uint8_t r,
                               std::uint8_t g, std::uint8_t b) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::size_t i = 0; i < buf.size(); i += 3) {
    buf[i] = std::byte{r};
    buf[i + 1] = std::byte{g};
    buf[i + 2] = std::byte{b};
  }
  return cc::ImageBuffer(w, h, cc::PixelFormat::RGB8, std::move(buf));
}

std::uint8_t planar_at(const cc::ImageBuffer& planar, std::size_t channel, std::uint32_t x,
                       std::uint32_t y) {
  const std::size_t plane = static_cast<std::size_t>(planar.width()) * planar.height();
  const auto* p = reinterpret_cast<const std::uint8_t*>(planar.data().data());
  return p[channel * plane + static_cast<std::size_t>(y) * planar.width() + x];
}

}  // namespace

TEST(Letterbox, WideSourceIsPaddedVertically) {
  const vis::LetterboxInfo info = vis::compute_letterbox({1280, 720}, {640, 640});
  EXPECT_FLOAT_EQ(info.scale, 0.5f);
  EXPECT_EQ(info.resized, (cc::ImageSize{640, 360}));
  EXPECT_EQ(info.pad_left, 0u);
  EXPECT_EQ(info.pad_top, 140u);
  EXPECT_EQ(info.source, (cc::ImageSize{1280, 720}));
  EXPECT_EQ(info.target, (cc::ImageSize{640, 640}));
}

TEST(Letterbox, TallSourceIsPaddedHorizontally) {
  const vis::LetterboxInfo info = vis::compute_letterbox({300, 600}, {640, 640});
  EXPECT_FLOAT_EQ(info.scale, 640.f / 600.f);
  EXPECT_EQ(info.resized, (cc::ImageSize{320, 640}));
  EXPECT_EQ(info.pad_left, 160u);
  EXPECT_EQ(info.pad_top, 0u);
}

TEST(Letterbox, MatchingSizeHasNoPadding) {
  const vis::LetterboxInfo info = vis::compute_letterbox({640, 640}, {640, 640});
  EXPECT_FLOAT_EQ(info.scale, 1.f);
  EXPECT_EQ(info.resized, (cc::ImageSize{640, 640}));
  EXPECT_EQ(info.pad_left, 0u);
  EXPECT_EQ(info.pad_top, 0u);
}

TEST(Letterbox, TinySourceKeepsAtLeastOnePixel) {
  const vis::LetterboxInfo info = vis::compute_letterbox({1000, 1}, {64, 64});
  EXPECT_GE(info.resized.height, 1u);
  EXPECT_EQ(info.resized.width, 64u);
}

TEST(LetterboxPreprocessor, ProducesPlanarAndInterleavedAtTargetSize) {
  const vis::LetterboxPreprocessor pre({64, 64});
  auto out = pre.process(make_solid_rgb(200, 100, 255, 0, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->planar.format(), cc::PixelFormat::RGB8Planar);
  EXPECT_EQ(out->planar.size(), (cc::ImageSize{64, 64}));
  EXPECT_EQ(out->interleaved.format(), cc::PixelFormat::RGB8);
  EXPECT_EQ(out->interleaved.size(), (cc::ImageSize{64, 64}));
  EXPECT_EQ(out->info.resized, (cc::ImageSize{64, 32}));
  EXPECT_EQ(out->info.pad_top, 16u);
}

TEST(LetterboxPreprocessor, PadsWithGrayAndKeepsContentCentered) {
  const vis::LetterboxPreprocessor pre({64, 64});
  auto out = pre.process(make_solid_rgb(200, 100, 255, 0, 0));
  ASSERT_TRUE(out.has_value());

  // Top padding band.
  for (std::size_t c = 0; c < 3; ++c) {
    EXPECT_EQ(planar_at(out->planar, c, 10, 2), 112u);
    EXPECT_EQ(planar_at(out->planar, c, 10, 60), 112u);
  }
  // Center of the resized content.
  EXPECT_NEAR(planar_at(out->planar, 0, 32, 32), 255, 1);
  EXPECT_NEAR(planar_at(out->planar, 1, 32, 32), 0, 1);
  EXPECT_NEAR(planar_at(out->planar, 2, 32, 32), 0, 1);
}

TEST(LetterboxPreprocessor, CustomPadColor) {
  const vis::LetterboxPreprocessor pre({32, 32}, vis::PadColor{1, 2, 3});
  auto out = pre.process(make_solid_rgb(32, 16, 0, 0, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(planar_at(out->planar, 0, 0, 0), 1u);
  EXPECT_EQ(planar_at(out->planar, 1, 0, 0), 2u);
  EXPECT_EQ(planar_at(out->planar, 2, 0, 0), 3u);
}

TEST(LetterboxPreprocessor, RejectsNonRgbInput) {
  const vis::LetterboxPreprocessor pre({64, 64});
  std::vector<std::byte> buf(16 * 16 * 3);
  cc::ImageBuffer bgr(16, 16, cc::PixelFormat::BGR8, std::move(buf));
  auto out = pre.process(bgr);
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), cc::PipelineError::InvalidFrame);

  auto empty = pre.process(cc::ImageBuffer{});
  ASSERT_FALSE(empty.has_value());
  EXPECT_EQ(empty.error(), cc::PipelineError::InvalidFrame);
}

TEST(LetterboxPreprocessor, RejectsZeroTarget) {
  const vis::LetterboxPreprocessor pre({0, 64});
  auto out = pre.process(make_solid_rgb(8, 8, 0, 0, 0));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), cc::PipelineError::InvalidConfig);
}

TEST(LetterboxPreprocessor, MissingFileFailsToLoad) {
  auto out = vis::preprocess("does_not_exist_4711.png", {640, 640});
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), cc::PipelineError::ImageLoadFailed);
}
