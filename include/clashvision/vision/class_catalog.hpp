#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace clashvision::vision {

/// Classes the bundled detector was trained on; values are model class ids.
enum class BuildingClass : std::uint8_t {
  ElixirStorage = 0,
  GoldStorage = 1,
};

struct Rgba {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};
  std::uint8_t a{255};

  friend bool operator==(const Rgba&, const Rgba&) = default;
};

inline constexpr std::size_t kNumClasses = 2;

inline constexpr std::array<std::string_view, kNumClasses> kClassNames{
    "Elixir Storage",
    "Gold Storage",
};

inline constexpr std::array<Rgba, kNumClasses> kClassPalette{
    Rgba{255, 0, 255, 255},   // magenta
    Rgba{212, 175, 55, 255},  // gold
};

/// Used for class ids outside the palette.
inline constexpr Rgba kUnknownClassColor{0x80, 0x10, 0x40, 0xFF};

[[nodiscard]] constexpr std::optional<BuildingClass> class_from_id(int class_id) noexcept {
  if (class_id < 0 || static_cast<std::size_t>(class_id) >= kNumClasses) return std::nullopt;
  return static_cast<BuildingClass>(class_id);
}

/// "Unknown" for ids outside the catalog.
[[nodiscard]] constexpr std::string_view class_name(int class_id) noexcept {
  if (class_id < 0 || static_cast<std::size_t>(class_id) >= kNumClasses) return "Unknown";
  return kClassNames[static_cast<std::size_t>(class_id)];
}

[[nodiscard]] constexpr Rgba class_color(int class_id) noexcept {
  if (class_id < 0 || static_cast<std::size_t>(class_id) >= kNumClasses) {
    return kUnknownClassColor;
  }
  return kClassPalette[static_cast<std::size_t>(class_id)];
}

}  // namespace clashvision::vision
