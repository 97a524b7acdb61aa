#include <clashvision/vision/nms.hpp>
#include <algorithm>
#include <iterator>
#include <vector>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

void sort_by_confidence(cc::DetectionSet& boxes) {
  std::stable_sort(boxes.begin(), boxes.end(), [](const cc::Box& a, const cc::Box& b) {
    return a.confidence > b.confidence;
  });
}

/// Single greedy pass over \p sorted (already confidence-ordered).
cc::DetectionSet greedy_nms(const cc::DetectionSet& sorted, float iou_threshold,
                            std::optional<std::size_t> max_detections) {
  cc::DetectionSet kept;
  kept.reserve(sorted.size());
  std::vector<bool> suppressed(sorted.size(), false);

  for (std::size_t i = 0; i < sorted.size(); ++i) {
    if (max_detections && kept.size() >= *max_detections) break;
    if (suppressed[i]) continue;

    const cc::Box& current = sorted[i];
    kept.push_back(current);

    for (std::size_t j = i + 1; j < sorted.size(); ++j) {
      if (!suppressed[j] && current.iou(sorted[j]) > iou_threshold) {
        suppressed[j] = true;
      }
    }
  }
  return kept;
}

}  // namespace

cc::DetectionSet filter_by_confidence(std::span<const cc::Box> boxes, float threshold) {
  cc::DetectionSet out;
  out.reserve(boxes.size());
  std::copy_if(boxes.begin(), boxes.end(), std::back_inserter(out),
               [threshold](const cc::Box& b) { return b.confidence >= threshold; });
  return out;
}

std::map<int, cc::DetectionSet> group_by_class(std::span<const cc::Box> boxes) {
  std::map<int, cc::DetectionSet> grouped;
  for (const auto& b : boxes) {
    grouped[b.class_id].push_back(b);
  }
  return grouped;
}

cc::DetectionSet suppress(std::span<const cc::Box> boxes, const SuppressionOptions& options) {
  cc::DetectionSet candidates = filter_by_confidence(boxes, options.confidence_floor);
  if (candidates.empty()) {
    return candidates;
  }

  if (!options.per_class) {
    sort_by_confidence(candidates);
    return greedy_nms(candidates, options.iou_threshold, options.max_detections);
  }

  cc::DetectionSet merged;
  merged.reserve(candidates.size());
  for (auto& group : group_by_class(candidates)) {
    cc::DetectionSet& class_boxes = group.second;
    sort_by_confidence(class_boxes);
    cc::DetectionSet kept =
        greedy_nms(class_boxes, options.iou_threshold, options.max_detections);
    merged.insert(merged.end(), kept.begin(), kept.end());
  }
  sort_by_confidence(merged);
  if (options.max_detections && merged.size() > *options.max_detections) {
    merged.resize(*options.max_detections);
  }
  return merged;
}

}  // namespace clashvision::vision
