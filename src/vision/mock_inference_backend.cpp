#include <clashvision/vision/mock_inference_backend.hpp>
#include <clashvision/core/error.hpp>
#include <utility>

namespace clashvision::vision {

void MockInferenceBackend::set_output(RawTensor output) {
  output_ = std::move(output);
}

void MockInferenceBackend::set_failure(std::optional<clashvision::core::PipelineError> error) {
  failure_ = error;
}

std::expected<RawTensor, clashvision::core::PipelineError>
MockInferenceBackend::infer(const clashvision::core::ImageBuffer& input) {
  ++calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return output_;
}

std::expected<void, clashvision::core::PipelineError>
MockInferenceBackend::validate_input(const clashvision::core::ImageBuffer& input) const {
  if (input.empty() || input.format() != clashvision::core::PixelFormat::Float32Planar) {
    return std::unexpected(clashvision::core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace clashvision::vision
