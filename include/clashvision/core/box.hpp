#pragma once

#include <clashvision/core/error.hpp>
#include <expected>
#include <utility>
#include <vector>

namespace clashvision::core {

/// Axis-aligned bounding box in corner form with class and confidence.
/// Coordinates are in whatever pixel space the producer used (model input
/// space after decoding, source image space after unletterboxing).
struct Box {
  float x1{0.f};
  float y1{0.f};
  float x2{0.f};
  float y2{0.f};
  int class_id{0};
  float confidence{0.f};

  /// Builds a box from center coordinates and dimensions. Not validated.
  [[nodiscard]] static Box from_center(float cx, float cy, float width, float height,
                                       int class_id, float confidence) noexcept;

  /// Builds a box and checks x1 < x2, y1 < y2 and confidence in [0, 1].
  [[nodiscard]] static std::expected<Box, PipelineError> validated(
      float x1, float y1, float x2, float y2, int class_id, float confidence);

  [[nodiscard]] bool is_valid() const noexcept;

  [[nodiscard]] float area() const noexcept;
  [[nodiscard]] float intersection(const Box& other) const noexcept;
  [[nodiscard]] float union_area(const Box& other) const noexcept;

  /// Intersection over union; 0 when the boxes do not overlap or either is degenerate.
  [[nodiscard]] float iou(const Box& other) const noexcept;

  [[nodiscard]] std::pair<float, float> center() const noexcept;
  [[nodiscard]] std::pair<float, float> dimensions() const noexcept;

  [[nodiscard]] Box scaled(float scale_x, float scale_y) const noexcept;

  friend bool operator==(const Box&, const Box&) = default;
};

/// Detections for one image. Order is meaningful only after suppression.
using DetectionSet = std::vector<Box>;

}  // namespace clashvision::core
