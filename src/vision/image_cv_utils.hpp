#pragma once

#include <clashvision/core/image_buffer.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace clashvision::vision::detail {

/// Wrap an interleaved 8-bit ImageBuffer as a cv::Mat header (no copy).
/// Returns nullopt for planar or unknown formats.
std::optional<cv::Mat> image_to_mat(const clashvision::core::ImageBuffer& image);

/// Convert cv::Mat to ImageBuffer (copy).
clashvision::core::ImageBuffer mat_to_image(const cv::Mat& mat,
                                            clashvision::core::PixelFormat format);

}  // namespace clashvision::vision::detail
