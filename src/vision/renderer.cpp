#include <clashvision/vision/renderer.hpp>
#include "image_cv_utils.hpp"
#include <clashvision/vision/class_catalog.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

// Cap height of FONT_HERSHEY_SIMPLEX at fontScale 1.0, in pixels.
constexpr double kHersheyBaseHeight = 22.0;

std::string label_for(const cc::Box& box) {
  char conf[16];
  std::snprintf(conf, sizeof(conf), "%.2f", static_cast<double>(box.confidence));
  return std::string(class_name(box.class_id)) + " " + conf;
}

void draw_box(cv::Mat& overlay, const cc::Box& box, float scale_x, float scale_y,
              const DrawConfig& config) {
  const cc::Box s = box.scaled(scale_x, scale_y);
  const Rgba color = class_color(box.class_id);
  const cv::Scalar c(color.r, color.g, color.b, color.a);
  const int thickness = std::max(1, static_cast<int>(std::lround(config.line_width)));

  cv::rectangle(overlay,
                cv::Point(static_cast<int>(std::lround(s.x1)), static_cast<int>(std::lround(s.y1))),
                cv::Point(static_cast<int>(std::lround(s.x2)), static_cast<int>(std::lround(s.y2))),
                c, thickness, cv::LINE_8);

  if (config.show_confidence && config.font_size > 0.f) {
    const double font_scale = config.font_size / kHersheyBaseHeight;
    const int text_y = std::max(static_cast<int>(config.font_size),
                                static_cast<int>(std::lround(s.y1)) - thickness - 2);
    cv::putText(overlay, label_for(box),
                cv::Point(static_cast<int>(std::lround(s.x1)), text_y),
                cv::FONT_HERSHEY_SIMPLEX, font_scale, c, 1, cv::LINE_8);
  }
}

/// Composites the RGBA overlay onto the RGB image in place.
void composite(cv::Mat& rgb, const cv::Mat& overlay, bool alpha_blend) {
  for (int y = 0; y < rgb.rows; ++y) {
    auto* dst = rgb.ptr<cv::Vec3b>(y);
    const auto* src = overlay.ptr<cv::Vec4b>(y);
    for (int x = 0; x < rgb.cols; ++x) {
      const unsigned alpha = src[x][3];
      if (alpha == 0) continue;
      if (!alpha_blend) {
        dst[x] = cv::Vec3b(src[x][0], src[x][1], src[x][2]);
        continue;
      }
      const unsigned inv_alpha = 255u - alpha;
      for (int c = 0; c < 3; ++c) {
        dst[x][c] = static_cast<uchar>((src[x][c] * alpha + dst[x][c] * inv_alpha) / 255u);
      }
    }
  }
}

}  // namespace

std::expected<cc::ImageBuffer, cc::PipelineError>
render(const cc::ImageBuffer& rgb, std::span<const cc::Box> boxes, cc::ImageSize input_size,
       const DrawConfig& config) {
  if (rgb.format() != cc::PixelFormat::RGB8) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  if (input_size.width == 0 || input_size.height == 0) {
    return std::unexpected(cc::PipelineError::InvalidConfig);
  }
  auto src = detail::image_to_mat(rgb);
  if (!src) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }

  cv::Mat out = src->clone();
  if (boxes.empty()) {
    return detail::mat_to_image(out, cc::PixelFormat::RGB8);
  }

  const float scale_x = static_cast<float>(rgb.width()) / static_cast<float>(input_size.width);
  const float scale_y = static_cast<float>(rgb.height()) / static_cast<float>(input_size.height);

  cv::Mat overlay = cv::Mat::zeros(out.rows, out.cols, CV_8UC4);
  for (const auto& box : boxes) {
    draw_box(overlay, box, scale_x, scale_y, config);
  }
  composite(out, overlay, config.alpha_blend);

  return detail::mat_to_image(out, cc::PixelFormat::RGB8);
}

cc::DetectionSet unletterbox(std::span<const cc::Box> boxes, const LetterboxInfo& info) {
  cc::DetectionSet out;
  out.reserve(boxes.size());
  if (info.scale <= 0.f) {
    return out;
  }
  const auto max_x = static_cast<float>(info.source.width);
  const auto max_y = static_cast<float>(info.source.height);
  const auto pad_x = static_cast<float>(info.pad_left);
  const auto pad_y = static_cast<float>(info.pad_top);

  for (const auto& b : boxes) {
    cc::Box m = b;
    m.x1 = std::clamp((b.x1 - pad_x) / info.scale, 0.f, max_x);
    m.y1 = std::clamp((b.y1 - pad_y) / info.scale, 0.f, max_y);
    m.x2 = std::clamp((b.x2 - pad_x) / info.scale, 0.f, max_x);
    m.y2 = std::clamp((b.y2 - pad_y) / info.scale, 0.f, max_y);
    out.push_back(m);
  }
  return out;
}

}  // namespace clashvision::vision
