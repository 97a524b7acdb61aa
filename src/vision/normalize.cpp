#include <clashvision/vision/normalize.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <vector>

namespace clashvision::vision {

namespace cc = clashvision::core;

std::expected<cc::ImageBuffer, cc::PipelineError>
normalize(const cc::ImageBuffer& planar, const NormalizationProfile& profile) {
  if (planar.format() != cc::PixelFormat::RGB8Planar || !planar.is_consistent()) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  for (const float s : profile.std) {
    if (s == 0.f) {
      return std::unexpected(cc::PipelineError::InvalidConfig);
    }
  }

  const int h = static_cast<int>(planar.height());
  const int w = static_cast<int>(planar.width());
  const std::size_t plane = static_cast<std::size_t>(h) * w;

  std::vector<std::byte> buffer(plane * 3 * sizeof(float));
  auto* dst_base = reinterpret_cast<float*>(buffer.data());
  const auto* src_base = reinterpret_cast<const std::uint8_t*>(planar.data().data());

  for (std::size_t c = 0; c < 3; ++c) {
    const double scale = 1.0 / (255.0 * profile.std[c]);
    const double offset = -static_cast<double>(profile.mean[c]) / profile.std[c];
    const cv::Mat src(h, w, CV_8UC1, const_cast<std::uint8_t*>(src_base + c * plane));
    cv::Mat dst(h, w, CV_32FC1, dst_base + c * plane);
    src.convertTo(dst, CV_32F, scale, offset);
  }

  return cc::ImageBuffer(planar.width(), planar.height(), cc::PixelFormat::Float32Planar,
                         std::move(buffer));
}

}  // namespace clashvision::vision
