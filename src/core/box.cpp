#include <clashvision/core/box.hpp>
#include <algorithm>

namespace clashvision::core {

Box Box::from_center(float cx, float cy, float width, float height,
                     int class_id, float confidence) noexcept {
  const float half_w = width * 0.5f;
  const float half_h = height * 0.5f;
  return Box{cx - half_w, cy - half_h, cx + half_w, cy + half_h, class_id, confidence};
}

std::expected<Box, PipelineError> Box::validated(
    float x1, float y1, float x2, float y2, int class_id, float confidence) {
  Box b{x1, y1, x2, y2, class_id, confidence};
  if (!b.is_valid()) {
    return std::unexpected(PipelineError::InvalidBox);
  }
  return b;
}

bool Box::is_valid() const noexcept {
  // Written so that NaN coordinates or confidences fail too.
  return x1 < x2 && y1 < y2 && confidence >= 0.f && confidence <= 1.f;
}

float Box::area() const noexcept {
  return (x2 - x1) * (y2 - y1);
}

float Box::intersection(const Box& other) const noexcept {
  const float w = std::max(0.f, std::min(x2, other.x2) - std::max(x1, other.x1));
  const float h = std::max(0.f, std::min(y2, other.y2) - std::max(y1, other.y1));
  return w * h;
}

float Box::union_area(const Box& other) const noexcept {
  return area() + other.area() - intersection(other);
}

float Box::iou(const Box& other) const noexcept {
  const float inter = intersection(other);
  if (inter <= 0.f) {
    return 0.f;
  }
  const float uni = union_area(other);
  if (uni <= 0.f) {
    return 0.f;
  }
  return inter / uni;
}

std::pair<float, float> Box::center() const noexcept {
  return {(x1 + x2) * 0.5f, (y1 + y2) * 0.5f};
}

std::pair<float, float> Box::dimensions() const noexcept {
  return {x2 - x1, y2 - y1};
}

Box Box::scaled(float scale_x, float scale_y) const noexcept {
  Box b = *this;
  b.x1 *= scale_x;
  b.x2 *= scale_x;
  b.y1 *= scale_y;
  b.y2 *= scale_y;
  return b;
}

}  // namespace clashvision::core
