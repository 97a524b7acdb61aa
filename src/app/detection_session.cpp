#include <clashvision/app/detection_session.hpp>
#include <clashvision/core/log.hpp>
#include <clashvision/vision/exporter.hpp>
#include <clashvision/vision/image_io.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <clashvision/vision/nms.hpp>
#include <clashvision/vision/normalize.hpp>
#include <clashvision/vision/onnx_inference_backend.hpp>
#include <clashvision/vision/renderer.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace clashvision::app {

namespace cc = clashvision::core;
namespace vis = clashvision::vision;
namespace fs = std::filesystem;

namespace {

constexpr const char* kTarget = "session";

vis::DetectorVariant variant_or_throw(const SessionConfig& config) {
  auto variant = vis::parse_detector_variant(config.model_variant);
  if (!variant) {
    throw std::invalid_argument("unknown model_variant: " + config.model_variant);
  }
  return *variant;
}

void check_config(const SessionConfig& config) {
  if (config.input_width == 0 || config.input_height == 0) {
    throw std::invalid_argument("input_width and input_height must be positive");
  }
}

std::string fail_message(const std::string& path, cc::PipelineError e) {
  return path + ": " + std::string(cc::error_name(e));
}

std::expected<void, cc::PipelineError> write_bytes(const fs::path& path,
                                                   const std::vector<std::uint8_t>& bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  out.write(reinterpret_cast<const char*>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  return {};
}

/// Hidden sibling used while an output is being written.
fs::path staging_path(const fs::path& target) {
  return target.parent_path() / ("." + target.filename().string() + ".part");
}

/// Adopts the model's fixed input size when it declares one.
void adopt_model_input_size(SessionConfig& config, const vis::OnnxInferenceBackend& backend) {
  const cc::ImageSize model_size = backend.input_size();
  if (model_size.width == 0 || model_size.height == 0) return;
  if (model_size.width != config.input_width || model_size.height != config.input_height) {
    cc::Logger::log(cc::LogLevel::Info,
                    "model declares input " + std::to_string(model_size.width) + "x" +
                        std::to_string(model_size.height) + ", overriding configured " +
                        std::to_string(config.input_width) + "x" +
                        std::to_string(config.input_height),
                    kTarget);
    config.input_width = model_size.width;
    config.input_height = model_size.height;
  }
}

}  // namespace

std::string_view state_name(SessionState state) noexcept {
  switch (state) {
    case SessionState::Created: return "Created";
    case SessionState::ImageLoaded: return "ImageLoaded";
    case SessionState::Inferred: return "Inferred";
    case SessionState::Suppressed: return "Suppressed";
    case SessionState::Rendered: return "Rendered";
    case SessionState::Saved: return "Saved";
  }
  return "Unknown";
}

DetectionSession::DetectionSession(std::unique_ptr<vis::IInferenceBackend> backend,
                                   SessionConfig config)
    : backend_(std::move(backend)),
      config_(std::move(config)),
      decoder_(variant_or_throw(config_)) {
  if (!backend_) {
    throw std::invalid_argument("DetectionSession requires an inference backend");
  }
  check_config(config_);
}

void DetectionSession::set_config(SessionConfig config) {
  const vis::DetectorVariant variant = variant_or_throw(config);
  check_config(config);
  config_ = std::move(config);
  decoder_ = vis::OutputDecoder(variant);
}

ModelInfo DetectionSession::model_info() const {
  ModelInfo info;
  info.model_name = config_.model_path.empty()
                        ? std::string("embedded")
                        : fs::path(config_.model_path).filename().string();
  info.input_width = config_.input_width;
  info.input_height = config_.input_height;
  info.confidence_threshold = config_.confidence_threshold;
  info.iou_threshold = config_.iou_threshold;
  info.use_nms = config_.use_nms;
  return info;
}

void DetectionSession::advance(SessionState next) {
  if (static_cast<int>(next) != static_cast<int>(state_) + 1) {
    throw std::logic_error("session state " + std::string(state_name(state_)) +
                           " cannot advance to " + std::string(state_name(next)));
  }
  state_ = next;
}

std::expected<PreparedImage, cc::PipelineError> DetectionSession::load_and_preprocess(
    const std::string& image_path) const {
  auto source = vis::load_image(image_path);
  if (!source) {
    return std::unexpected(source.error());
  }
  const vis::LetterboxPreprocessor preprocessor(
      cc::ImageSize{config_.input_width, config_.input_height}, config_.pad_color);
  auto letterboxed = preprocessor.process(*source);
  if (!letterboxed) {
    return std::unexpected(letterboxed.error());
  }
  auto input = vis::normalize(letterboxed->planar, config_.normalization);
  if (!input) {
    return std::unexpected(input.error());
  }
  return PreparedImage{std::move(*source), std::move(*letterboxed), std::move(*input)};
}

std::expected<cc::DetectionSet, cc::PipelineError> DetectionSession::run_inference(
    const cc::ImageBuffer& input) {
  if (auto valid = backend_->validate_input(input); !valid) {
    return std::unexpected(valid.error());
  }
  auto tensor = backend_->infer(input);
  if (!tensor) {
    return std::unexpected(tensor.error());
  }
  return decoder_.decode(*tensor, config_.confidence_threshold);
}

cc::DetectionSet DetectionSession::apply_suppression(std::span<const cc::Box> boxes) const {
  if (!config_.use_nms) {
    return cc::DetectionSet(boxes.begin(), boxes.end());
  }
  vis::SuppressionOptions options;
  options.iou_threshold = config_.iou_threshold;
  options.confidence_floor = config_.confidence_threshold;
  options.max_detections = config_.max_detections;
  options.per_class = config_.per_class_nms;
  return vis::suppress(boxes, options);
}

std::expected<void, cc::PipelineError> DetectionSession::save_outputs(
    const cc::ImageBuffer& annotated,
    std::span<const cc::Box> boxes,
    const std::string& image_path,
    const std::string& output_dir,
    ImageReport& report) const {
  // Both payloads are produced before anything touches the filesystem.
  auto jpeg = vis::encode_image(".jpg", annotated);
  if (!jpeg) {
    return std::unexpected(jpeg.error());
  }
  auto record = vis::export_detections(boxes, annotated.size(), config_.output_format,
                                       config_.export_config);
  if (!record) {
    return std::unexpected(record.error());
  }

  const fs::path dir(output_dir.empty() ? std::string("output") : output_dir);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    CLASHVISION_LOG_ERROR("cannot create output directory " + dir.string() + ": " + ec.message());
    return std::unexpected(cc::PipelineError::IoFailed);
  }

  const std::string stem = fs::path(image_path).stem().string();
  const fs::path image_out = dir / (stem + ".jpg");
  const fs::path record_out =
      dir / (stem + "." + std::string(vis::file_extension(config_.output_format)));

  // Both outputs are staged beside their targets and renamed into place only
  // once both writes succeeded.
  const fs::path image_part = staging_path(image_out);
  const fs::path record_part = staging_path(record_out);
  auto discard = [&](cc::PipelineError e) -> std::expected<void, cc::PipelineError> {
    std::error_code rm;
    fs::remove(image_part, rm);
    fs::remove(record_part, rm);
    return std::unexpected(e);
  };

  if (auto written = write_bytes(image_part, *jpeg); !written) {
    return discard(written.error());
  }
  if (auto written = vis::write_file(record_part.string(), *record); !written) {
    return discard(written.error());
  }

  fs::rename(image_part, image_out, ec);
  if (ec) {
    CLASHVISION_LOG_ERROR("cannot move " + image_part.string() + " into place: " + ec.message());
    return discard(cc::PipelineError::IoFailed);
  }
  fs::rename(record_part, record_out, ec);
  if (ec) {
    CLASHVISION_LOG_ERROR("cannot move " + record_part.string() + " into place: " + ec.message());
    std::error_code rm;
    fs::remove(image_out, rm);
    return discard(cc::PipelineError::IoFailed);
  }

  report.image_output = image_out.string();
  report.record_output = record_out.string();
  return {};
}

ImageResult DetectionSession::process_image(const std::string& image_path) {
  return process_image(image_path, config_.output_dir);
}

ImageResult DetectionSession::process_image(const std::string& image_path,
                                            const std::string& output_dir) {
  state_ = SessionState::Created;

  auto prepared = load_and_preprocess(image_path);
  if (!prepared) {
    return std::unexpected(prepared.error());
  }
  advance(SessionState::ImageLoaded);

  auto decoded = run_inference(prepared->input);
  if (!decoded) {
    return std::unexpected(decoded.error());
  }
  advance(SessionState::Inferred);

  const cc::DetectionSet kept = apply_suppression(*decoded);
  advance(SessionState::Suppressed);

  ImageReport report;
  report.image_path = image_path;
  report.image_size = prepared->source.size();
  report.detections = vis::unletterbox(kept, prepared->letterboxed.info);
  report.stats = vis::compute_stats(report.detections);

  auto annotated =
      vis::render(prepared->source, report.detections, report.image_size, config_.draw);
  if (!annotated) {
    return std::unexpected(annotated.error());
  }
  advance(SessionState::Rendered);

  if (auto saved = save_outputs(*annotated, report.detections, image_path, output_dir, report);
      !saved) {
    return std::unexpected(saved.error());
  }
  advance(SessionState::Saved);

  CLASHVISION_LOG_DEBUG(image_path + ": " + std::to_string(report.detections.size()) +
                        " detection(s) -> " + report.image_output);
  return report;
}

std::vector<ImageResult> DetectionSession::process_images_batch(
    const std::vector<std::string>& image_paths) {
  return process_images_batch(image_paths, config_.output_dir);
}

std::vector<ImageResult> DetectionSession::process_images_batch(
    const std::vector<std::string>& image_paths, const std::string& output_dir) {
  std::vector<ImageResult> results;
  results.reserve(image_paths.size());
  std::size_t failed = 0;
  for (const auto& path : image_paths) {
    auto result = process_image(path, output_dir);
    if (!result) {
      ++failed;
      cc::Logger::log(cc::LogLevel::Warn, fail_message(path, result.error()), kTarget);
    }
    results.push_back(std::move(result));
  }
  cc::Logger::log(cc::LogLevel::Info,
                  "batch finished: " + std::to_string(image_paths.size() - failed) + " ok, " +
                      std::to_string(failed) + " failed",
                  kTarget);
  return results;
}

std::unique_ptr<DetectionSession> make_onnx_session(SessionConfig config) {
  if (config.model_path.empty()) {
    throw std::runtime_error("make_onnx_session requires model_path to be set");
  }
  auto backend = std::make_unique<vis::OnnxInferenceBackend>(config.model_path);
  adopt_model_input_size(config, *backend);
  backend->warmup();
  return std::make_unique<DetectionSession>(std::move(backend), std::move(config));
}

std::unique_ptr<DetectionSession> make_onnx_session(SessionConfig config,
                                                    std::span<const std::byte> model_bytes) {
  auto backend = std::make_unique<vis::OnnxInferenceBackend>(model_bytes);
  adopt_model_input_size(config, *backend);
  backend->warmup();
  config.model_path.clear();
  return std::make_unique<DetectionSession>(std::move(backend), std::move(config));
}

}  // namespace clashvision::app
