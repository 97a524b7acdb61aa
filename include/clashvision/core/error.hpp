#pragma once

#include <string_view>

namespace clashvision::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  ImageLoadFailed,   // missing path, unsupported or corrupt image
  InferenceFailed,   // runtime invocation or output extraction failed
  ShapeMismatch,     // output tensor does not match the decoder layout
  IoFailed,          // output directory or file write failed
  InvalidConfig,     // e.g. unsupported detector variant
  InvalidBox,
};

/// Stable, human-readable name for logs and CLI messages.
[[nodiscard]] constexpr std::string_view error_name(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::ImageLoadFailed:
      return "ImageLoadFailed";
    case PipelineError::InferenceFailed:
      return "InferenceFailed";
    case PipelineError::ShapeMismatch:
      return "ShapeMismatch";
    case PipelineError::IoFailed:
      return "IoFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::InvalidBox:
      return "InvalidBox";
  }
  return "Unknown";
}

}  // namespace clashvision::core
