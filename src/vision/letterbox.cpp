#include <clashvision/vision/letterbox.hpp>
#include "image_cv_utils.hpp"
#include <clashvision/vision/image_io.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

int to_cv_interpolation(ResizeFilter filter) {
  switch (filter) {
    case ResizeFilter::Linear: return cv::INTER_LINEAR;
    case ResizeFilter::Cubic: return cv::INTER_CUBIC;
    case ResizeFilter::Area: return cv::INTER_AREA;
    case ResizeFilter::Lanczos: return cv::INTER_LANCZOS4;
  }
  return cv::INTER_LINEAR;
}

/// HWC (interleaved) 8-bit -> CHW (planar) 8-bit.
cc::ImageBuffer interleaved_to_planar(const cv::Mat& rgb) {
  const std::size_t plane = static_cast<std::size_t>(rgb.rows) * rgb.cols;
  std::vector<std::byte> buffer(plane * 3);
  std::vector<cv::Mat> channels;
  cv::split(rgb, channels);
  for (std::size_t c = 0; c < 3; ++c) {
    const cv::Mat& ch = channels[c];
    std::memcpy(buffer.data() + c * plane, ch.ptr(), plane);
  }
  return cc::ImageBuffer(static_cast<std::uint32_t>(rgb.cols),
                         static_cast<std::uint32_t>(rgb.rows),
                         cc::PixelFormat::RGB8Planar, std::move(buffer));
}

}  // namespace

LetterboxInfo compute_letterbox(cc::ImageSize source, cc::ImageSize target) {
  LetterboxInfo info;
  info.source = source;
  info.target = target;

  const float scale_x = static_cast<float>(target.width) / static_cast<float>(source.width);
  const float scale_y = static_cast<float>(target.height) / static_cast<float>(source.height);
  info.scale = std::min(scale_x, scale_y);

  const auto new_w = static_cast<std::uint32_t>(
      std::lround(static_cast<float>(source.width) * info.scale));
  const auto new_h = static_cast<std::uint32_t>(
      std::lround(static_cast<float>(source.height) * info.scale));
  info.resized.width = std::clamp<std::uint32_t>(new_w, 1u, target.width);
  info.resized.height = std::clamp<std::uint32_t>(new_h, 1u, target.height);

  info.pad_left = (target.width - info.resized.width) / 2;
  info.pad_top = (target.height - info.resized.height) / 2;
  return info;
}

LetterboxPreprocessor::LetterboxPreprocessor(cc::ImageSize target,
                                             PadColor pad_color,
                                             ResizeFilter filter)
    : target_(target), pad_color_(pad_color), filter_(filter) {}

std::expected<LetterboxedImage, cc::PipelineError>
LetterboxPreprocessor::process(const cc::ImageBuffer& rgb) const {
  if (rgb.format() != cc::PixelFormat::RGB8 || rgb.width() == 0 || rgb.height() == 0) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  if (target_.width == 0 || target_.height == 0) {
    return std::unexpected(cc::PipelineError::InvalidConfig);
  }
  auto src = detail::image_to_mat(rgb);
  if (!src) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }

  const LetterboxInfo info = compute_letterbox(rgb.size(), target_);

  cv::Mat resized;
  if (info.resized == rgb.size()) {
    resized = *src;
  } else {
    cv::resize(*src, resized,
               cv::Size(static_cast<int>(info.resized.width),
                        static_cast<int>(info.resized.height)),
               0, 0, to_cv_interpolation(filter_));
  }

  cv::Mat canvas(static_cast<int>(target_.height), static_cast<int>(target_.width), CV_8UC3,
                 cv::Scalar(pad_color_.r, pad_color_.g, pad_color_.b));
  const cv::Rect roi(static_cast<int>(info.pad_left), static_cast<int>(info.pad_top),
                     resized.cols, resized.rows);
  resized.copyTo(canvas(roi));

  LetterboxedImage out;
  out.planar = interleaved_to_planar(canvas);
  out.interleaved = detail::mat_to_image(canvas, cc::PixelFormat::RGB8);
  out.info = info;
  return out;
}

std::expected<LetterboxedImage, cc::PipelineError>
LetterboxPreprocessor::load_and_process(const std::string& path) const {
  auto image = load_image(path);
  if (!image) {
    return std::unexpected(image.error());
  }
  return process(*image);
}

std::expected<LetterboxedImage, cc::PipelineError>
preprocess(const std::string& path, cc::ImageSize target, PadColor pad_color) {
  return LetterboxPreprocessor(target, pad_color).load_and_process(path);
}

}  // namespace clashvision::vision
