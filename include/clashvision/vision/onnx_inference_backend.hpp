#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/inference_backend.hpp>
#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace clashvision::vision {

/// Name of the detector head output this project decodes.
inline constexpr const char* kDefaultOutputName = "output0";

/// ONNX Runtime inference backend.
///
/// Expected model: one float input [1, 3, H, W] (H and W may be dynamic) and an
/// output tensor named \p output_name ("output0" for Ultralytics exports) with
/// shape [1, attributes, candidates] (YOLOv8) or [1, candidates, 6] (YOLOv10).
/// Only that output is fetched from the runtime.
///
/// Construction loads the model; failures throw (Ort::Exception for a missing
/// or malformed model, std::runtime_error for an unsupported signature).
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  explicit OnnxInferenceBackend(const std::string& model_path,
                                std::string output_name = kDefaultOutputName);

  /// \param model_bytes In-memory .onnx model (e.g. embedded at build time).
  explicit OnnxInferenceBackend(std::span<const std::byte> model_bytes,
                                std::string output_name = kDefaultOutputName);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<RawTensor, clashvision::core::PipelineError>
  infer(const clashvision::core::ImageBuffer& input) override;

  [[nodiscard]] std::expected<void, clashvision::core::PipelineError>
  validate_input(const clashvision::core::ImageBuffer& input) const override;

  void warmup() override;

  /// Fixed model input size, or {0, 0} if the model declares dynamic H/W.
  [[nodiscard]] clashvision::core::ImageSize input_size() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace clashvision::vision
