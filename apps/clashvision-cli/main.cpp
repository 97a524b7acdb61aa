/**
 * clashvision-cli: detect storage buildings in screenshots; write annotated
 * images and detection records.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/clashvision_cli [--config path] [--model path] <image>...
 * Output: <output-dir>/<stem>.jpg and <output-dir>/<stem>.txt (or .json).
 */

#include <clashvision/app/config.hpp>
#include <clashvision/app/detection_session.hpp>
#include <clashvision/core/error.hpp>
#include <clashvision/core/log.hpp>
#include <clashvision/vision/class_catalog.hpp>
#include <clashvision/vision/exporter.hpp>
#ifdef CLASHVISION_HAS_EMBEDDED_MODEL
#include <clashvision/app/embedded_model.hpp>
#endif

#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: clashvision_cli [options] <image>...\n"
            << "  --config <path>      Session config (key=value file); default: built-in\n"
            << "  --model <path>       ONNX model path (overrides config)\n"
            << "  --variant <name>     yolov8 | yolov10 (overrides config)\n"
            << "  --output-dir <dir>   Output directory (default: output)\n"
            << "  --format <txt|json>  Detection record format (default: txt)\n"
            << "  --no-nms             Skip non-maximum suppression\n"
            << "  --per-class          Suppress per class instead of class-agnostic\n"
            << "\nLogging: CLASHVISION_LOG_LEVEL=debug|info|warn|error, "
               "CLASHVISION_LOG_FORMAT=pretty|json\n";
}

void print_report(const clashvision::app::ImageReport& report) {
  std::cout << report.image_path << ": " << report.detections.size() << " detection(s)";
  if (report.stats.total_detections > 0) {
    char conf[64];
    std::snprintf(conf, sizeof(conf), " conf avg=%.3f min=%.3f max=%.3f",
                  report.stats.average_confidence, report.stats.min_confidence,
                  report.stats.max_confidence);
    std::cout << conf;
  }
  std::cout << "\n";
  for (const auto& b : report.detections) {
    std::cout << "  " << clashvision::vision::class_name(b.class_id)
              << " confidence=" << b.confidence << " bbox=(" << b.x1 << "," << b.y1 << ","
              << b.x2 << "," << b.y2 << ")\n";
  }
  std::cout << "  -> " << report.image_output << ", " << report.record_output << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  clashvision::core::Logger::init();

  std::string config_path;
  std::string model_override;
  std::string variant_override;
  std::string output_dir_override;
  std::string format_override;
  bool no_nms = false;
  bool per_class = false;
  std::vector<std::string> images;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--variant" && i + 1 < argc) {
      variant_override = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      output_dir_override = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      format_override = argv[++i];
    } else if (arg == "--no-nms") {
      no_nms = true;
    } else if (arg == "--per-class") {
      per_class = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option " << arg << "\n";
      print_usage();
      return 1;
    } else {
      images.push_back(arg);
    }
  }

  if (images.empty()) {
    print_usage();
    return 1;
  }

  clashvision::app::SessionConfig cfg = clashvision::app::default_config();
  if (!config_path.empty()) {
    auto loaded = clashvision::app::load_config(config_path);
    if (!loaded) {
      std::cerr << "Invalid config " << config_path << ": "
                << clashvision::core::error_name(loaded.error()) << "\n";
      return 1;
    }
    cfg = std::move(*loaded);
  }
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!variant_override.empty()) cfg.model_variant = variant_override;
  if (!output_dir_override.empty()) cfg.output_dir = output_dir_override;
  if (!format_override.empty()) {
    auto format = clashvision::vision::parse_export_format(format_override);
    if (!format) {
      std::cerr << "Unknown --format " << format_override << " (use txt or json)\n";
      return 1;
    }
    cfg.output_format = *format;
  }
  if (no_nms) cfg.use_nms = false;
  if (per_class) cfg.per_class_nms = true;

  std::unique_ptr<clashvision::app::DetectionSession> session;
  try {
#ifdef CLASHVISION_HAS_EMBEDDED_MODEL
    if (cfg.model_path.empty()) {
      session = clashvision::app::make_onnx_session(cfg, clashvision::app::embedded_model());
    } else {
      session = clashvision::app::make_onnx_session(cfg);
    }
#else
    if (cfg.model_path.empty()) {
      std::cerr << "No model: pass --model or set model_path in the config\n";
      return 1;
    }
    session = clashvision::app::make_onnx_session(cfg);
#endif
  } catch (const std::exception& e) {
    std::cerr << "Failed to create session: " << e.what() << "\n";
    return 1;
  }

  const auto info = session->model_info();
  CLASHVISION_LOG_INFO("model " + info.model_name + " input " +
                       std::to_string(info.input_width) + "x" +
                       std::to_string(info.input_height));

  const auto results = session->process_images_batch(images);
  int exit_code = 0;
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (results[i]) {
      print_report(*results[i]);
    } else {
      std::cerr << images[i] << ": " << clashvision::core::error_name(results[i].error())
                << "\n";
      exit_code = 1;
    }
  }
  return exit_code;
}
