#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace clashvision::vision {

/// Load an image file as interleaved RGB8 (grayscale and alpha inputs are
/// converted). Fails with ImageLoadFailed if the path is missing or the file
/// cannot be decoded.
[[nodiscard]] std::expected<clashvision::core::ImageBuffer, clashvision::core::PipelineError>
load_image(const std::string& path);

/// Encode an RGB8 image to an in-memory file, format chosen by extension (".jpg", ".png").
[[nodiscard]] std::expected<std::vector<std::uint8_t>, clashvision::core::PipelineError>
encode_image(const std::string& extension, const clashvision::core::ImageBuffer& rgb);

/// Write an RGB8 image to disk; format from the file extension.
[[nodiscard]] std::expected<void, clashvision::core::PipelineError>
save_image(const std::string& path, const clashvision::core::ImageBuffer& rgb);

}  // namespace clashvision::vision
