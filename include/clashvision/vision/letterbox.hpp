#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace clashvision::vision {

/// Fill color for the letterbox border (RGB).
struct PadColor {
  std::uint8_t r{112};
  std::uint8_t g{112};
  std::uint8_t b{112};

  friend bool operator==(const PadColor&, const PadColor&) = default;
};

inline constexpr PadColor kDefaultPadColor{112, 112, 112};

/// Interpolation used for the aspect-preserving resize. Nearest-neighbour is
/// deliberately not offered: it shifts edges and therefore box locations.
enum class ResizeFilter : std::uint8_t {
  Linear,
  Cubic,
  Area,
  Lanczos,
};

/// Geometry of one letterbox operation, needed to map boxes back to the source.
struct LetterboxInfo {
  float scale{1.f};
  std::uint32_t pad_left{0};
  std::uint32_t pad_top{0};
  clashvision::core::ImageSize resized{};
  clashvision::core::ImageSize source{};
  clashvision::core::ImageSize target{};
};

/// Output of the preprocessor: the CHW buffer the model consumes, the same
/// canvas in interleaved RGB8 (for debugging / drawing) and the geometry.
struct LetterboxedImage {
  clashvision::core::ImageBuffer planar;       // RGB8Planar, target size
  clashvision::core::ImageBuffer interleaved;  // RGB8, target size
  LetterboxInfo info;
};

/// Scale and centered padding for fitting \p source inside \p target.
/// Both sizes must be non-zero.
[[nodiscard]] LetterboxInfo compute_letterbox(clashvision::core::ImageSize source,
                                              clashvision::core::ImageSize target);

/// Resizes preserving aspect ratio, pads to a fixed canvas (centered) and
/// emits a channel-planar buffer.
class LetterboxPreprocessor {
 public:
  explicit LetterboxPreprocessor(clashvision::core::ImageSize target,
                                 PadColor pad_color = kDefaultPadColor,
                                 ResizeFilter filter = ResizeFilter::Lanczos);

  /// \p rgb must be an RGB8 image; otherwise InvalidFrame.
  [[nodiscard]] std::expected<LetterboxedImage, clashvision::core::PipelineError>
  process(const clashvision::core::ImageBuffer& rgb) const;

  /// Load from disk (ImageLoadFailed on missing/corrupt file) then process().
  [[nodiscard]] std::expected<LetterboxedImage, clashvision::core::PipelineError>
  load_and_process(const std::string& path) const;

  [[nodiscard]] clashvision::core::ImageSize target() const noexcept { return target_; }
  [[nodiscard]] PadColor pad_color() const noexcept { return pad_color_; }

 private:
  clashvision::core::ImageSize target_;
  PadColor pad_color_;
  ResizeFilter filter_;
};

/// Convenience: LetterboxPreprocessor(target, pad).load_and_process(path).
[[nodiscard]] std::expected<LetterboxedImage, clashvision::core::PipelineError>
preprocess(const std::string& path, clashvision::core::ImageSize target,
           PadColor pad_color = kDefaultPadColor);

}  // namespace clashvision::vision
