#pragma once

#include <clashvision/core/box.hpp>
#include <cstddef>
#include <set>
#include <span>

namespace clashvision::vision {

/// Summary of one image's detections, for logs and reports.
struct DetectionStats {
  std::size_t total_detections{0};
  std::set<int> classes_detected;
  float average_confidence{0.f};
  float min_confidence{0.f};
  float max_confidence{0.f};
};

/// All-zero stats for an empty span.
[[nodiscard]] DetectionStats compute_stats(std::span<const clashvision::core::Box> boxes);

}  // namespace clashvision::vision
