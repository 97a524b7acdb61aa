#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace clashvision::core {

/// Memory: ImageBuffer owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() / as<T>() for non-owning views.
/// Thread-safety: distinct ImageBuffer instances are independent.

/// Width x height in pixels.
struct ImageSize {
  std::uint32_t width{0};
  std::uint32_t height{0};

  [[nodiscard]] float aspect_ratio() const noexcept {
    return height == 0 ? 0.f : static_cast<float>(width) / static_cast<float>(height);
  }

  friend bool operator==(const ImageSize&, const ImageSize&) = default;
};

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  RGB8,           // HWC interleaved, as decoded
  BGR8,           // HWC interleaved, OpenCV native order
  RGB8Planar,     // CHW uint8, letterboxed model input before normalization
  Float32Planar,  // CHW float, normalized model input
};

/// Image or tensor-shaped pixel buffer: dimensions, format and owned bytes.
class ImageBuffer {
 public:
  ImageBuffer() = default;

  ImageBuffer(std::uint32_t width,
              std::uint32_t height,
              PixelFormat format,
              std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] ImageSize size() const noexcept { return {width_, height_}; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  /// Typed view of the buffer, e.g. as<float>() for Float32Planar.
  template <typename T>
  [[nodiscard]] std::span<const T> as() const noexcept {
    return std::span<const T>(reinterpret_cast<const T*>(buffer_.data()),
                              buffer_.size() / sizeof(T));
  }
  template <typename T>
  [[nodiscard]] std::span<T> as() noexcept {
    return std::span<T>(reinterpret_cast<T*>(buffer_.data()), buffer_.size() / sizeof(T));
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

  /// True if the buffer holds at least min_bytes() for its own dimensions.
  [[nodiscard]] bool is_consistent() const noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace clashvision::core
