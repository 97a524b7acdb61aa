#pragma once

#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace clashvision::vision {

enum class ExportFormat : std::uint8_t {
  NormalizedText,  // YOLO label lines: "cls cx cy w h", normalized to [0, 1]
  Json,
};

struct ExportConfig {
  /// Append the confidence as a sixth column (text format only).
  bool include_confidence{false};
  /// Digits after the decimal point (text format only).
  int precision{6};
};

/// "txt" or "json".
[[nodiscard]] std::string_view file_extension(ExportFormat format) noexcept;

/// Accepts "txt"/"text"/"yolo" and "json"; InvalidConfig otherwise.
[[nodiscard]] std::expected<ExportFormat, clashvision::core::PipelineError>
parse_export_format(std::string_view name);

/// Serializes boxes (in \p image_size pixel coordinates).
///
/// NormalizedText: one "{cls} {cx} {cy} {w} {h}\n" line per box with fixed
/// precision; no boxes gives an empty string.
/// Json: {"image_width", "image_height", "detections": [{class_id,
/// class_name, confidence, bbox[x1,y1,x2,y2], normalized_bbox[...]}]}.
/// InvalidConfig if either image dimension is zero.
[[nodiscard]] std::expected<std::string, clashvision::core::PipelineError>
export_detections(std::span<const clashvision::core::Box> boxes,
                  clashvision::core::ImageSize image_size,
                  ExportFormat format,
                  const ExportConfig& config = {});

/// Writes \p content to \p path (truncating). IoFailed on any error.
[[nodiscard]] std::expected<void, clashvision::core::PipelineError>
write_file(const std::string& path, std::string_view content);

}  // namespace clashvision::vision
