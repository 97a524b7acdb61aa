#include <clashvision/vision/onnx_inference_backend.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/core/log.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "clashvision"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  // 0 when the model declares a dynamic dimension.
  std::uint32_t input_height{0};
  std::uint32_t input_width{0};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  /// Reads the input signature and checks that \p requested_output exists.
  void inspect(std::string requested_output) {
    Ort::AllocatorWithDefaultOptions allocator;
    if (session.GetInputCount() == 0) {
      throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
    }
    input_name = session.GetInputNameAllocated(0, allocator).get();

    const auto dims = session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
    if (dims.size() != 4u || (dims[1] != kNumChannels && dims[1] > 0)) {
      throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W]");
    }
    input_height = dims[2] > 0 ? static_cast<std::uint32_t>(dims[2]) : 0u;
    input_width = dims[3] > 0 ? static_cast<std::uint32_t>(dims[3]) : 0u;

    const std::size_t num_outputs = session.GetOutputCount();
    for (std::size_t i = 0; i < num_outputs; ++i) {
      if (requested_output == session.GetOutputNameAllocated(i, allocator).get()) {
        output_name = std::move(requested_output);
        return;
      }
    }
    throw std::runtime_error("OnnxInferenceBackend: model has no output named '" +
                             requested_output + "'");
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(const std::string& model_path,
                                           std::string output_name)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);
  impl_->inspect(std::move(output_name));
  CLASHVISION_LOG_INFO("loaded ONNX model from " + model_path);
}

OnnxInferenceBackend::OnnxInferenceBackend(std::span<const std::byte> model_bytes,
                                           std::string output_name)
    : impl_(std::make_unique<Impl>()) {
  if (model_bytes.empty()) {
    throw std::runtime_error("OnnxInferenceBackend: empty model buffer");
  }
  impl_->session = Ort::Session(impl_->env, model_bytes.data(), model_bytes.size(),
                                impl_->session_options);
  impl_->inspect(std::move(output_name));
  CLASHVISION_LOG_INFO("loaded embedded ONNX model (" + std::to_string(model_bytes.size()) +
                       " bytes)");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

cc::ImageSize OnnxInferenceBackend::input_size() const noexcept {
  return {impl_->input_width, impl_->input_height};
}

std::expected<void, cc::PipelineError>
OnnxInferenceBackend::validate_input(const cc::ImageBuffer& input) const {
  if (input.empty() || input.format() != cc::PixelFormat::Float32Planar) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  if ((impl_->input_width != 0 && input.width() != impl_->input_width) ||
      (impl_->input_height != 0 && input.height() != impl_->input_height)) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  if (!input.is_consistent()) {
    return std::unexpected(cc::PipelineError::InvalidFrame);
  }
  return {};
}

std::expected<RawTensor, cc::PipelineError>
OnnxInferenceBackend::infer(const cc::ImageBuffer& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::size_t num_floats =
      static_cast<std::size_t>(kNumChannels) * input.height() * input.width();
  const std::array<std::int64_t, 4> shape{1, kNumChannels,
                                          static_cast<std::int64_t>(input.height()),
                                          static_cast<std::int64_t>(input.width())};
  // Input is already CHW; ORT only reads from the buffer.
  auto* src = const_cast<float*>(input.as<float>().data());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};

  RawTensor result;
  try {
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, src, num_floats, shape.data(), shape.size());

    Ort::RunOptions run_options;
    std::vector<Ort::Value> outputs = impl_->session.Run(
        run_options, input_names_c, &input_tensor, 1, output_names_c, 1);
    if (outputs.size() != 1u || !outputs[0].IsTensor()) {
      return std::unexpected(cc::PipelineError::InferenceFailed);
    }

    const auto info = outputs[0].GetTensorTypeAndShapeInfo();
    if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      CLASHVISION_LOG_ERROR("output '" + impl_->output_name + "' is not a float tensor");
      return std::unexpected(cc::PipelineError::InferenceFailed);
    }
    result.name = impl_->output_name;
    result.shape = info.GetShape();
    const float* data = outputs[0].GetTensorData<float>();
    result.data.assign(data, data + info.GetElementCount());
  } catch (const Ort::Exception& e) {
    CLASHVISION_LOG_ERROR(std::string("ONNX Runtime inference failed: ") + e.what());
    return std::unexpected(cc::PipelineError::InferenceFailed);
  }
  return result;
}

void OnnxInferenceBackend::warmup() {
  const std::uint32_t w = impl_->input_width != 0 ? impl_->input_width : 640u;
  const std::uint32_t h = impl_->input_height != 0 ? impl_->input_height : 640u;
  std::vector<std::byte> buffer(
      cc::ImageBuffer::min_bytes(w, h, cc::PixelFormat::Float32Planar), std::byte{0});
  cc::ImageBuffer dummy(w, h, cc::PixelFormat::Float32Planar, std::move(buffer));
  auto result = infer(dummy);
  if (!result) {
    CLASHVISION_LOG_WARN("warmup inference failed: " +
                         std::string(cc::error_name(result.error())));
  }
}

}  // namespace clashvision::vision
