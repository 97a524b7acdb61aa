#include <clashvision/app/config.hpp>
#include <clashvision/core/log.hpp>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string_view>
#include <system_error>

namespace clashvision::app {

namespace cc = clashvision::core;
namespace vis = clashvision::vision;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

template <typename T>
bool parse_number(const std::string& s, T& out) {
  const char* first = s.data();
  const char* last = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

bool parse_bool(const std::string& s, bool& out) {
  if (s == "true" || s == "1" || s == "yes" || s == "on") {
    out = true;
    return true;
  }
  if (s == "false" || s == "0" || s == "no" || s == "off") {
    out = false;
    return true;
  }
  return false;
}

/// "r,g,b" with each component in [0, 255].
bool parse_pad_color(const std::string& s, vis::PadColor& out) {
  std::istringstream in(s);
  std::string part;
  unsigned values[3];
  for (int i = 0; i < 3; ++i) {
    if (!std::getline(in, part, ',')) return false;
    trim(part);
    if (!parse_number(part, values[i]) || values[i] > 255u) return false;
  }
  if (std::getline(in, part, ',')) return false;
  out = {static_cast<std::uint8_t>(values[0]), static_cast<std::uint8_t>(values[1]),
         static_cast<std::uint8_t>(values[2])};
  return true;
}

}  // namespace

SessionConfig default_config() {
  return SessionConfig{};
}

std::expected<bool, cc::PipelineError>
apply_config_value(SessionConfig& c, const std::string& key, const std::string& value) {
  bool ok = true;
  if (key == "model_path") c.model_path = value;
  else if (key == "model_variant") c.model_variant = value;
  else if (key == "input_width") ok = parse_number(value, c.input_width) && c.input_width > 0;
  else if (key == "input_height") ok = parse_number(value, c.input_height) && c.input_height > 0;
  else if (key == "confidence_threshold") ok = parse_number(value, c.confidence_threshold);
  else if (key == "iou_threshold") ok = parse_number(value, c.iou_threshold);
  else if (key == "use_nms") ok = parse_bool(value, c.use_nms);
  else if (key == "per_class_nms") ok = parse_bool(value, c.per_class_nms);
  else if (key == "max_detections") {
    std::size_t n = 0;
    ok = parse_number(value, n);
    if (ok) c.max_detections = n == 0 ? std::nullopt : std::optional<std::size_t>(n);
  }
  else if (key == "line_width") ok = parse_number(value, c.draw.line_width);
  else if (key == "alpha_blend") ok = parse_bool(value, c.draw.alpha_blend);
  else if (key == "show_confidence") ok = parse_bool(value, c.draw.show_confidence);
  else if (key == "font_size") ok = parse_number(value, c.draw.font_size);
  else if (key == "output_format") {
    auto format = vis::parse_export_format(value);
    ok = format.has_value();
    if (ok) c.output_format = *format;
  }
  else if (key == "include_confidence") ok = parse_bool(value, c.export_config.include_confidence);
  else if (key == "precision") {
    ok = parse_number(value, c.export_config.precision) && c.export_config.precision >= 0;
  }
  else if (key == "output_dir") {
    ok = !value.empty();
    if (ok) c.output_dir = value;
  }
  else if (key == "normalization") {
    if (value == "none") c.normalization = vis::NormalizationProfile::none();
    else if (value == "imagenet") c.normalization = vis::NormalizationProfile::imagenet();
    else ok = false;
  }
  else if (key == "pad_color") ok = parse_pad_color(value, c.pad_color);
  else return false;

  if (!ok) {
    return std::unexpected(cc::PipelineError::InvalidConfig);
  }
  return true;
}

std::expected<SessionConfig, cc::PipelineError> load_config(const std::string& path) {
  SessionConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    CLASHVISION_LOG_INFO("config file " + path + " not found, using defaults");
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) {
      CLASHVISION_LOG_WARN(path + ":" + std::to_string(line_no) + ": expected key=value");
      continue;
    }

    auto applied = apply_config_value(c, key, value);
    if (!applied) {
      CLASHVISION_LOG_ERROR(path + ":" + std::to_string(line_no) + ": invalid value for " +
                            key + ": '" + value + "'");
      return std::unexpected(applied.error());
    }
    if (!*applied) {
      CLASHVISION_LOG_WARN(path + ":" + std::to_string(line_no) + ": unknown key " + key);
    }
  }
  return c;
}

}  // namespace clashvision::app
