#pragma once

#include <clashvision/core/box.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <span>

namespace clashvision::vision {

struct SuppressionOptions {
  float iou_threshold{0.45f};
  /// Boxes with confidence below this are dropped before suppression.
  float confidence_floor{0.f};
  /// Stop once this many boxes are selected.
  std::optional<std::size_t> max_detections;
  /// Only boxes of the same class suppress each other.
  bool per_class{false};
};

/// Greedy non-maximum suppression.
///
/// Boxes are stable-sorted by confidence (descending); a box is kept unless a
/// previously kept box overlaps it with IoU strictly above the threshold.
/// Per-class mode runs independently per class id (ascending), then merges
/// and stable-sorts the union by confidence; max_detections caps the merged
/// result. The output is always a subset of the floor-filtered input.
[[nodiscard]] clashvision::core::DetectionSet suppress(
    std::span<const clashvision::core::Box> boxes, const SuppressionOptions& options);

/// Keeps boxes with confidence >= threshold, preserving order.
[[nodiscard]] clashvision::core::DetectionSet filter_by_confidence(
    std::span<const clashvision::core::Box> boxes, float threshold);

/// Partitions boxes by class id, preserving relative order within each class.
[[nodiscard]] std::map<int, clashvision::core::DetectionSet> group_by_class(
    std::span<const clashvision::core::Box> boxes);

}  // namespace clashvision::vision
