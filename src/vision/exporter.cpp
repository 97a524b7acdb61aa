#include <clashvision/vision/exporter.hpp>
#include <clashvision/vision/class_catalog.hpp>
#include <opencv2/core.hpp>
#include <opencv2/core/persistence.hpp>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace clashvision::vision {

namespace cc = clashvision::core;

namespace {

std::string to_normalized_text(std::span<const cc::Box> boxes, cc::ImageSize size,
                               const ExportConfig& config) {
  const auto w = static_cast<float>(size.width);
  const auto h = static_cast<float>(size.height);

  std::ostringstream out;
  out << std::fixed << std::setprecision(config.precision);
  for (const auto& b : boxes) {
    const auto [cx, cy] = b.center();
    const auto [bw, bh] = b.dimensions();
    out << b.class_id << ' ' << cx / w << ' ' << cy / h << ' ' << bw / w << ' ' << bh / h;
    if (config.include_confidence) {
      out << ' ' << b.confidence;
    }
    out << '\n';
  }
  return out.str();
}

std::string to_json(std::span<const cc::Box> boxes, cc::ImageSize size) {
  const auto w = static_cast<float>(size.width);
  const auto h = static_cast<float>(size.height);

  cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY |
                                  cv::FileStorage::FORMAT_JSON);
  fs << "image_width" << static_cast<int>(size.width);
  fs << "image_height" << static_cast<int>(size.height);
  fs << "detections" << "[";
  for (const auto& b : boxes) {
    fs << "{";
    fs << "class_id" << b.class_id;
    fs << "class_name" << std::string(class_name(b.class_id));
    fs << "confidence" << b.confidence;
    fs << "bbox" << "[" << b.x1 << b.y1 << b.x2 << b.y2 << "]";
    fs << "normalized_bbox" << "[" << b.x1 / w << b.y1 / h << b.x2 / w << b.y2 / h << "]";
    fs << "}";
  }
  fs << "]";
  return fs.releaseAndGetString();
}

}  // namespace

std::string_view file_extension(ExportFormat format) noexcept {
  switch (format) {
    case ExportFormat::NormalizedText: return "txt";
    case ExportFormat::Json: return "json";
  }
  return "txt";
}

std::expected<ExportFormat, cc::PipelineError> parse_export_format(std::string_view name) {
  if (name == "txt" || name == "text" || name == "yolo") return ExportFormat::NormalizedText;
  if (name == "json") return ExportFormat::Json;
  return std::unexpected(cc::PipelineError::InvalidConfig);
}

std::expected<std::string, cc::PipelineError>
export_detections(std::span<const cc::Box> boxes, cc::ImageSize image_size,
                  ExportFormat format, const ExportConfig& config) {
  if (image_size.width == 0 || image_size.height == 0) {
    return std::unexpected(cc::PipelineError::InvalidConfig);
  }
  switch (format) {
    case ExportFormat::NormalizedText:
      return to_normalized_text(boxes, image_size, config);
    case ExportFormat::Json:
      try {
        return to_json(boxes, image_size);
      } catch (const cv::Exception&) {
        return std::unexpected(cc::PipelineError::IoFailed);
      }
  }
  return std::unexpected(cc::PipelineError::InvalidConfig);
}

std::expected<void, cc::PipelineError> write_file(const std::string& path,
                                                  std::string_view content) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f) {
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  f.write(content.data(), static_cast<std::streamsize>(content.size()));
  f.close();
  if (!f) {
    return std::unexpected(cc::PipelineError::IoFailed);
  }
  return {};
}

}  // namespace clashvision::vision
