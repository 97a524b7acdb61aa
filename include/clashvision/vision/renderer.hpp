#pragma once

#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <expected>
#include <span>

namespace clashvision::vision {

/// Drawing parameters for annotated output images.
struct DrawConfig {
  float line_width{4.f};
  /// Composite the overlay using its per-pixel alpha; otherwise paint it opaquely.
  bool alpha_blend{true};
  /// Draw "<class name> <confidence>" above each box.
  bool show_confidence{false};
  /// Label height in pixels.
  float font_size{12.f};

  friend bool operator==(const DrawConfig&, const DrawConfig&) = default;
};

/// Draws \p boxes (given in \p input_size coordinates) on a copy of \p rgb.
///
/// Boxes are mapped with scale_x = image_w / input_w and scale_y =
/// image_h / input_h only; letterbox padding is not undone here (use
/// unletterbox() first for letterboxed model coordinates).
/// InvalidFrame unless \p rgb is RGB8; InvalidConfig for an empty input_size.
[[nodiscard]] std::expected<clashvision::core::ImageBuffer, clashvision::core::PipelineError>
render(const clashvision::core::ImageBuffer& rgb,
       std::span<const clashvision::core::Box> boxes,
       clashvision::core::ImageSize input_size,
       const DrawConfig& config = {});

/// Maps boxes from letterboxed model space to source image pixels:
/// (v - pad) / scale, clamped to the source bounds.
[[nodiscard]] clashvision::core::DetectionSet unletterbox(
    std::span<const clashvision::core::Box> boxes, const LetterboxInfo& info);

}  // namespace clashvision::vision
