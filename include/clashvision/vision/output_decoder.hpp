#pragma once

#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/vision/raw_tensor.hpp>
#include <cstdint>
#include <expected>
#include <string_view>

namespace clashvision::vision {

/// Detector family; determines the output tensor layout.
enum class DetectorVariant : std::uint8_t {
  YoloV8,   // dense anchor-free head: (1, 4 + classes, candidates), center form
  YoloV10,  // NMS-free top-k head: (1, candidates, 6), corner form + conf + class
};

/// Case-insensitive "yolov8" / "yolov10"; InvalidConfig otherwise.
[[nodiscard]] std::expected<DetectorVariant, clashvision::core::PipelineError>
parse_detector_variant(std::string_view name);

[[nodiscard]] std::string_view variant_name(DetectorVariant variant) noexcept;

/// Dense layout. Per candidate column, arg-max over class rows (strict '>', so
/// the lowest class id wins ties); emitted when max score > threshold.
[[nodiscard]] std::expected<clashvision::core::DetectionSet, clashvision::core::PipelineError>
decode_dense(const RawTensor& tensor, float confidence_threshold);

/// Top-k layout. Rows are emitted as-is when confidence >= threshold; rows whose
/// class column is not a finite value in int range are skipped.
[[nodiscard]] std::expected<clashvision::core::DetectionSet, clashvision::core::PipelineError>
decode_topk(const RawTensor& tensor, float confidence_threshold);

/// Decodes raw output into candidate boxes in model input coordinates.
/// The strategy is fixed at construction.
class OutputDecoder {
 public:
  explicit OutputDecoder(DetectorVariant variant) noexcept : variant_(variant) {}

  /// ShapeMismatch if the tensor does not match the variant's layout.
  [[nodiscard]] std::expected<clashvision::core::DetectionSet, clashvision::core::PipelineError>
  decode(const RawTensor& tensor, float confidence_threshold) const;

  [[nodiscard]] DetectorVariant variant() const noexcept { return variant_; }

 private:
  DetectorVariant variant_;
};

}  // namespace clashvision::vision
