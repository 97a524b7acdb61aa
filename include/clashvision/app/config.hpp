#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/vision/exporter.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <clashvision/vision/normalize.hpp>
#include <clashvision/vision/renderer.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace clashvision::app {

/// Per-run session configuration. Treated as immutable while an image is being
/// processed; replace it wholesale between runs.
struct SessionConfig {
  std::string model_path;
  /// "yolov8" (dense head) or "yolov10" (top-k head).
  std::string model_variant{"yolov8"};
  std::uint32_t input_width{640};
  std::uint32_t input_height{640};
  float confidence_threshold{0.25f};
  float iou_threshold{0.45f};
  bool use_nms{true};
  bool per_class_nms{false};
  std::optional<std::size_t> max_detections;
  clashvision::vision::DrawConfig draw{};
  clashvision::vision::ExportFormat output_format{
      clashvision::vision::ExportFormat::NormalizedText};
  clashvision::vision::ExportConfig export_config{};
  std::string output_dir{"output"};
  clashvision::vision::NormalizationProfile normalization{
      clashvision::vision::NormalizationProfile::none()};
  clashvision::vision::PadColor pad_color{clashvision::vision::kDefaultPadColor};
};

/// Default config when no file is provided.
SessionConfig default_config();

/// Load config from a key=value file (one per line, '#' comments), starting
/// from default_config(). A missing file yields the defaults; unknown keys are
/// logged and ignored; a malformed value fails with InvalidConfig.
[[nodiscard]] std::expected<SessionConfig, clashvision::core::PipelineError>
load_config(const std::string& path);

/// Applies one key=value pair to \p config. InvalidConfig on a bad value,
/// false (and no change) for an unknown key.
[[nodiscard]] std::expected<bool, clashvision::core::PipelineError>
apply_config_value(SessionConfig& config, const std::string& key, const std::string& value);

}  // namespace clashvision::app
