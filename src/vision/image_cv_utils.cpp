#include "image_cv_utils.hpp"
#include <clashvision/core/image_buffer.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace clashvision::vision::detail {

namespace cc = clashvision::core;

std::optional<cv::Mat> image_to_mat(const cc::ImageBuffer& image) {
  if (!image.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  const std::size_t step = image.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case cc::PixelFormat::RGB8:
    case cc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case cc::PixelFormat::RGB8Planar:
    case cc::PixelFormat::Float32Planar:
    case cc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

cc::ImageBuffer mat_to_image(const cv::Mat& mat, cc::PixelFormat format) {
  if (mat.empty()) return cc::ImageBuffer();

  const cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(continuous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(continuous.rows);
  const std::size_t len = continuous.total() * continuous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), continuous.ptr(), len);
  return cc::ImageBuffer(w, h, format, std::move(buffer));
}

}  // namespace clashvision::vision::detail
