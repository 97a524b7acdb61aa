#pragma once

#include <clashvision/core/error.hpp>
#include <clashvision/core/image_buffer.hpp>
#include <array>
#include <expected>

namespace clashvision::vision {

/// Per-channel mean/std applied after scaling pixels to [0, 1].
struct NormalizationProfile {
  std::array<float, 3> mean{0.f, 0.f, 0.f};
  std::array<float, 3> std{1.f, 1.f, 1.f};

  /// mean 0, std 1: plain division by 255.
  [[nodiscard]] static constexpr NormalizationProfile none() noexcept {
    return {{0.f, 0.f, 0.f}, {1.f, 1.f, 1.f}};
  }

  [[nodiscard]] static constexpr NormalizationProfile imagenet() noexcept {
    return {{0.485f, 0.456f, 0.406f}, {0.229f, 0.224f, 0.225f}};
  }

  friend bool operator==(const NormalizationProfile&, const NormalizationProfile&) = default;
};

/// RGB8Planar -> Float32Planar: out = (in / 255 - mean[c]) / std[c], evaluated
/// as in * scale[c] + offset[c]. The result owns fresh storage.
/// InvalidFrame if the input is not a consistent RGB8Planar buffer,
/// InvalidConfig if any std is zero.
[[nodiscard]] std::expected<clashvision::core::ImageBuffer, clashvision::core::PipelineError>
normalize(const clashvision::core::ImageBuffer& planar,
          const NormalizationProfile& profile = NormalizationProfile::none());

}  // namespace clashvision::vision
