#include <clashvision/vision/output_decoder.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

constexpr std::size_t kBoxAttributes = 4;
constexpr std::size_t kTopkAttributes = 6;  // x1, y1, x2, y2, confidence, class_id

/// Rank 3, batch 1, non-negative dims and a data size matching the shape.
/// A zero dim is a valid empty output.
bool has_batched_3d_shape(const RawTensor& tensor) {
  if (tensor.shape.size() != 3u || tensor.shape[0] != 1) return false;
  if (tensor.shape[1] < 0 || tensor.shape[2] < 0) return false;
  const auto n = static_cast<std::size_t>(tensor.shape[1]) * static_cast<std::size_t>(tensor.shape[2]);
  return n == tensor.data.size();
}

/// Class id from a float column; nullopt unless finite and within int range.
std::optional<int> class_id_from(float value) {
  if (!std::isfinite(value)) return std::nullopt;
  const double v = std::trunc(static_cast<double>(value));
  if (v < static_cast<double>(std::numeric_limits<int>::min()) ||
      v > static_cast<double>(std::numeric_limits<int>::max())) {
    return std::nullopt;
  }
  return static_cast<int>(v);
}

}  // namespace

std::expected<DetectorVariant, cc::PipelineError> parse_detector_variant(std::string_view name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "yolov8") return DetectorVariant::YoloV8;
  if (lower == "yolov10") return DetectorVariant::YoloV10;
  return std::unexpected(cc::PipelineError::InvalidConfig);
}

std::string_view variant_name(DetectorVariant variant) noexcept {
  switch (variant) {
    case DetectorVariant::YoloV8: return "yolov8";
    case DetectorVariant::YoloV10: return "yolov10";
  }
  return "unknown";
}

std::expected<cc::DetectionSet, cc::PipelineError>
decode_dense(const RawTensor& tensor, float confidence_threshold) {
  if (!has_batched_3d_shape(tensor) || tensor.shape[1] <= static_cast<std::int64_t>(kBoxAttributes)) {
    return std::unexpected(cc::PipelineError::ShapeMismatch);
  }

  const auto num_rows = static_cast<std::size_t>(tensor.shape[1]);
  const auto stride = static_cast<std::size_t>(tensor.shape[2]);  // candidates
  const std::size_t num_classes = num_rows - kBoxAttributes;
  const float* raw = tensor.data.data();

  cc::DetectionSet boxes;
  boxes.reserve(stride / 10);

  for (std::size_t det = 0; det < stride; ++det) {
    std::size_t best_class = 0;
    float best_score = raw[kBoxAttributes * stride + det];
    for (std::size_t c = 1; c < num_classes; ++c) {
      const float score = raw[(kBoxAttributes + c) * stride + det];
      if (score > best_score) {
        best_score = score;
        best_class = c;
      }
    }

    if (best_score > confidence_threshold) {
      const float cx = raw[det];
      const float cy = raw[stride + det];
      const float w = raw[2 * stride + det];
      const float h = raw[3 * stride + det];
      boxes.push_back(cc::Box::from_center(cx, cy, w, h, static_cast<int>(best_class),
                                           best_score));
    }
  }
  return boxes;
}

std::expected<cc::DetectionSet, cc::PipelineError>
decode_topk(const RawTensor& tensor, float confidence_threshold) {
  if (!has_batched_3d_shape(tensor) || tensor.shape[2] < static_cast<std::int64_t>(kTopkAttributes)) {
    return std::unexpected(cc::PipelineError::ShapeMismatch);
  }

  const auto num_rows = static_cast<std::size_t>(tensor.shape[1]);
  const auto row_width = static_cast<std::size_t>(tensor.shape[2]);

  cc::DetectionSet boxes;
  boxes.reserve(num_rows);
  for (std::size_t i = 0; i < num_rows; ++i) {
    const float* row = tensor.data.data() + i * row_width;
    const float confidence = row[4];
    if (!(confidence >= confidence_threshold)) continue;
    const auto class_id = class_id_from(row[5]);
    if (!class_id) continue;  // not a class index
    boxes.push_back(cc::Box{row[0], row[1], row[2], row[3], *class_id, confidence});
  }
  return boxes;
}

std::expected<cc::DetectionSet, cc::PipelineError>
OutputDecoder::decode(const RawTensor& tensor, float confidence_threshold) const {
  switch (variant_) {
    case DetectorVariant::YoloV8:
      return decode_dense(tensor, confidence_threshold);
    case DetectorVariant::YoloV10:
      return decode_topk(tensor, confidence_threshold);
  }
  return std::unexpected(cc::PipelineError::InvalidConfig);
}

}  // namespace clashvision::vision
