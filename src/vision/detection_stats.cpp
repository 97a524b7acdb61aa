#include <clashvision/vision/detection_stats.hpp>
#include <algorithm>

namespace clashvision::vision {

DetectionStats compute_stats(std::span<const clashvision::core::Box> boxes) {
  DetectionStats stats;
  if (boxes.empty()) return stats;

  stats.total_detections = boxes.size();
  stats.min_confidence = boxes.front().confidence;
  stats.max_confidence = boxes.front().confidence;
  double sum = 0.0;
  for (const auto& b : boxes) {
    stats.classes_detected.insert(b.class_id);
    stats.min_confidence = std::min(stats.min_confidence, b.confidence);
    stats.max_confidence = std::max(stats.max_confidence, b.confidence);
    sum += b.confidence;
  }
  stats.average_confidence = static_cast<float>(sum / static_cast<double>(boxes.size()));
  return stats;
}

}  // namespace clashvision::vision
