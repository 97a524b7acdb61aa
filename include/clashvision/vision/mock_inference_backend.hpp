#pragma once

#include <clashvision/vision/inference_backend.hpp>
#include <cstddef>
#include <optional>

namespace clashvision::vision {

/// Mock backend that returns a configurable output tensor (for tests/demo).
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Tensor to return on every subsequent infer() call.
  void set_output(RawTensor output);

  /// Make every subsequent infer() fail with \p error; nullopt clears it.
  void set_failure(std::optional<clashvision::core::PipelineError> error);

  [[nodiscard]] std::expected<RawTensor, clashvision::core::PipelineError>
  infer(const clashvision::core::ImageBuffer& input) override;

  [[nodiscard]] std::expected<void, clashvision::core::PipelineError>
  validate_input(const clashvision::core::ImageBuffer& input) const override;

  [[nodiscard]] std::size_t call_count() const noexcept { return calls_; }

 private:
  RawTensor output_;
  std::optional<clashvision::core::PipelineError> failure_;
  std::size_t calls_{0};
};

}  // namespace clashvision::vision
