#pragma once

#include <clashvision/app/config.hpp>
#include <clashvision/core/box.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <clashvision/vision/detection_stats.hpp>
#include <clashvision/vision/inference_backend.hpp>
#include <clashvision/vision/letterbox.hpp>
#include <clashvision/vision/output_decoder.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clashvision::app {

/// Per-image pipeline progress. Each call to process_image() starts at
/// Created and advances one state at a time; a failure leaves the session in
/// the last state reached.
enum class SessionState : std::uint8_t {
  Created,
  ImageLoaded,
  Inferred,
  Suppressed,
  Rendered,
  Saved,
};

[[nodiscard]] std::string_view state_name(SessionState state) noexcept;

/// Descriptive snapshot of the session configuration.
struct ModelInfo {
  std::string model_name;
  std::uint32_t input_width{0};
  std::uint32_t input_height{0};
  float confidence_threshold{0.f};
  float iou_threshold{0.f};
  bool use_nms{false};
};

/// Result of one successfully processed image.
struct ImageReport {
  std::string image_path;
  /// Accepted boxes in source image pixel coordinates.
  clashvision::core::DetectionSet detections;
  clashvision::core::ImageSize image_size;
  std::string image_output;   // annotated .jpg
  std::string record_output;  // .txt or .json
  clashvision::vision::DetectionStats stats;
};

using ImageResult = std::expected<ImageReport, clashvision::core::PipelineError>;

/// Source image plus the model input derived from it.
struct PreparedImage {
  clashvision::core::ImageBuffer source;  // RGB8, original size
  clashvision::vision::LetterboxedImage letterboxed;
  clashvision::core::ImageBuffer input;   // Float32Planar, model input size
};

/// Owns the inference backend and the configuration and runs
/// load -> letterbox/normalize -> infer -> decode -> suppress -> render -> save
/// for one image at a time.
///
/// Thread-safety: none. Use one session per worker for parallel batches
/// (see run_sessions_parallel_tbb).
class DetectionSession {
 public:
  /// Throws std::invalid_argument for a null backend, an unknown
  /// model_variant or a zero input size.
  DetectionSession(std::unique_ptr<clashvision::vision::IInferenceBackend> backend,
                   SessionConfig config);

  DetectionSession(const DetectionSession&) = delete;
  DetectionSession& operator=(const DetectionSession&) = delete;
  DetectionSession(DetectionSession&&) noexcept = default;
  DetectionSession& operator=(DetectionSession&&) noexcept = default;
  ~DetectionSession() = default;

  /// Full pipeline; writes into config().output_dir.
  [[nodiscard]] ImageResult process_image(const std::string& image_path);

  /// Full pipeline; writes <output_dir>/<stem>.jpg and <stem>.<txt|json>.
  /// On failure nothing is left behind for this image.
  [[nodiscard]] ImageResult process_image(const std::string& image_path,
                                          const std::string& output_dir);

  /// Processes every path independently; one failure does not stop the batch.
  [[nodiscard]] std::vector<ImageResult> process_images_batch(
      const std::vector<std::string>& image_paths);
  [[nodiscard]] std::vector<ImageResult> process_images_batch(
      const std::vector<std::string>& image_paths, const std::string& output_dir);

  /// Load, letterbox and normalize.
  [[nodiscard]] std::expected<PreparedImage, clashvision::core::PipelineError>
  load_and_preprocess(const std::string& image_path) const;

  /// Infer and decode; boxes are in model input coordinates.
  [[nodiscard]] std::expected<clashvision::core::DetectionSet, clashvision::core::PipelineError>
  run_inference(const clashvision::core::ImageBuffer& input);

  /// NMS per config (identity when use_nms is off).
  [[nodiscard]] clashvision::core::DetectionSet apply_suppression(
      std::span<const clashvision::core::Box> boxes) const;

  [[nodiscard]] const SessionConfig& config() const noexcept { return config_; }

  /// Replaces the configuration wholesale. Throws like the constructor.
  void set_config(SessionConfig config);

  [[nodiscard]] ModelInfo model_info() const;
  [[nodiscard]] SessionState last_state() const noexcept { return state_; }
  [[nodiscard]] clashvision::vision::DetectorVariant variant() const noexcept {
    return decoder_.variant();
  }

 private:
  void advance(SessionState next);

  [[nodiscard]] std::expected<void, clashvision::core::PipelineError> save_outputs(
      const clashvision::core::ImageBuffer& annotated,
      std::span<const clashvision::core::Box> boxes,
      const std::string& image_path,
      const std::string& output_dir,
      ImageReport& report) const;

  std::unique_ptr<clashvision::vision::IInferenceBackend> backend_;
  SessionConfig config_;
  clashvision::vision::OutputDecoder decoder_;
  SessionState state_{SessionState::Created};
};

/// Session backed by ONNX Runtime loading config.model_path.
/// Throws (Ort::Exception, std::runtime_error, std::invalid_argument) on failure.
[[nodiscard]] std::unique_ptr<DetectionSession> make_onnx_session(SessionConfig config);

/// Session backed by ONNX Runtime loading an in-memory model.
[[nodiscard]] std::unique_ptr<DetectionSession> make_onnx_session(
    SessionConfig config, std::span<const std::byte> model_bytes);

}  // namespace clashvision::app
