#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/raw_tensor.hpp>
#include <expected>

namespace clashvision::vision {

/// Abstract inference backend: Float32Planar (1, 3, H, W) input -> the
/// detector's raw output tensor. One instance is not safe for concurrent use.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-image inference. Must be implemented.
  [[nodiscard]] virtual std::expected<RawTensor, clashvision::core::PipelineError>
  infer(const clashvision::core::ImageBuffer& input) = 0;

  /// Optional: validate format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, clashvision::core::PipelineError>
  validate_input(const clashvision::core::ImageBuffer& /*input*/) const {
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Default: no-op.
  virtual void warmup() {}
};

}  // namespace clashvision::vision
