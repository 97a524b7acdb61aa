#include <clashvision/vision/image_io.hpp>
#include "image_cv_utils.hpp"
#include <clashvision/core/log.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <filesystem>

namespace clashvision::vision {

namespace cc = clashvision::core;

std::expected<cc::ImageBuffer, cc::PipelineError> load_image(const std::string& path) {
  std::error_code ec;
  if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
    CLASHVISION_LOG_DEBUG("image not found: " + path);
    return std::unexpected(cc::PipelineError::ImageLoadFailed);
  }

  cv::Mat rgb;
  try {
    cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
    if (mat.empty()) {
      CLASHVISION_LOG_DEBUG("image could not be decoded: " + path);
      return std::unexpected(cc::PipelineError::ImageLoadFailed);
    }
    cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
  } catch (const cv::Exception& e) {
    CLASHVISION_LOG_DEBUG(std::string("imread failed: ") + e.what());
    return std::unexpected(cc::PipelineError::ImageLoadFailed);
  }

  return detail::mat_to_image(rgb, cc::PixelFormat::RGB8);
}

std::expected<std::vector<std::uint8_t>, cc::PipelineError>
encode_image(const std::string& extension, const cc::ImageBuffer& rgb) {
  if (rgb.format() != cc::PixelFormat::RGB8) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  auto mat = detail::image_to_mat(rgb);
  if (!mat) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }

  std::vector<std::uint8_t> bytes;
  try {
    cv::Mat bgr;
    cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
    if (!cv::imencode(extension, bgr, bytes)) {
      return std::unexpected(cc::PipelineError::IoFailed);
    }
  } catch (const cv::Exception& e) {
    CLASHVISION_LOG_WARN(std::string("imencode failed: ") + e.what());
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  return bytes;
}

std::expected<void, cc::PipelineError> save_image(const std::string& path,
                                                  const cc::ImageBuffer& rgb) {
  auto mat = detail::image_to_mat(rgb);
  if (!mat || rgb.format() != cc::PixelFormat::RGB8) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  try {
    cv::Mat bgr;
    cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
    if (!cv::imwrite(path, bgr)) {
      return std::unexpected(cc::PipelineError::IoFailed);
    }
  } catch (const cv::Exception& e) {
    CLASHVISION_LOG_WARN(std::string("imwrite failed: ") + e.what());
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  return {};
}

}  // namespace clashvision::vision
