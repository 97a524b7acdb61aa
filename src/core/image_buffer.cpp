#include <clashvision/core/image_buffer.hpp>
#include <cstddef>

namespace clashvision::core {

std::size_t ImageBuffer::min_bytes(std::uint32_t width,
                                   std::uint32_t height,
                                   PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
    case PixelFormat::RGB8Planar:
      return pixels * 3;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);  // CHW, 3 channels
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool ImageBuffer::is_consistent() const noexcept {
  if (empty() || format_ == PixelFormat::Unknown) return false;
  return size_bytes() >= min_bytes(width_, height_, format_);
}

}  // namespace clashvision::core
