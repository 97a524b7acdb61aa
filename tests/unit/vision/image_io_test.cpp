#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/image_io.hpp>
#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace cc = clashvision::core;
namespace vis = clashvision::vision;
namespace fs = std::filesystem;

namespace {

class ImageIoTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("clashvision_image_io_" +
            std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::create_directories(dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
};

cc::ImageBuffer make_red(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3, std::byte{0});
  for (std::size_t i = 0; i < buf.size(); i += 3) buf[i] = std::byte{255};
  return cc::ImageBuffer(w, h, cc::PixelFormat::RGB8, std::move(buf));
}

}  // namespace

TEST_F(ImageIoTest, MissingFileIsLoadError) {
  auto img = vis::load_image((dir_ / "missing.png").string());
  ASSERT_FALSE(img.has_value());
  EXPECT_EQ(img.error(), cc::PipelineError::ImageLoadFailed);
}

TEST_F(ImageIoTest, CorruptFileIsLoadError) {
  const fs::path path = dir_ / "corrupt.png";
  std::ofstream(path) << "definitely not a png";
  auto img = vis::load_image(path.string());
  ASSERT_FALSE(img.has_value());
  EXPECT_EQ(img.error(), cc::PipelineError::ImageLoadFailed);
}

TEST_F(ImageIoTest, LoadReturnsRgbOrder) {
  // Pure red written by OpenCV in BGR order.
  const fs::path path = dir_ / "red.png";
  cv::Mat bgr(4, 6, CV_8UC3, cv::Scalar(0, 0, 255));
  ASSERT_TRUE(cv::imwrite(path.string(), bgr));

  auto img = vis::load_image(path.string());
  ASSERT_TRUE(img.has_value());
  EXPECT_EQ(img->format(), cc::PixelFormat::RGB8);
  EXPECT_EQ(img->size(), (cc::ImageSize{6, 4}));
  const auto px = img->as<std::uint8_t>();
  EXPECT_EQ(px[0], 255u);
  EXPECT_EQ(px[1], 0u);
  EXPECT_EQ(px[2], 0u);
}

TEST_F(ImageIoTest, SaveWritesBgrOnDisk) {
  const fs::path path = dir_ / "saved.png";
  ASSERT_TRUE(vis::save_image(path.string(), make_red(5, 5)).has_value());
  cv::Mat read = cv::imread(path.string(), cv::IMREAD_COLOR);
  ASSERT_FALSE(read.empty());
  const cv::Vec3b px = read.at<cv::Vec3b>(2, 2);
  EXPECT_EQ(px[0], 0u);
  EXPECT_EQ(px[1], 0u);
  EXPECT_EQ(px[2], 255u);
}

TEST_F(ImageIoTest, EncodeJpegInMemory) {
  auto bytes = vis::encode_image(".jpg", make_red(16, 16));
  ASSERT_TRUE(bytes.has_value());
  ASSERT_GE(bytes->size(), 2u);
  EXPECT_EQ((*bytes)[0], 0xFFu);
  EXPECT_EQ((*bytes)[1], 0xD8u);
}

TEST_F(ImageIoTest, EncodeRejectsNonRgb) {
  std::vector<std::byte> buf(4 * 4 * 3);
  cc::ImageBuffer planar(4, 4, cc::PixelFormat::RGB8Planar, std::move(buf));
  auto bytes = vis::encode_image(".jpg", planar);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error(), cc::PipelineError::InvalidFrame);
}
