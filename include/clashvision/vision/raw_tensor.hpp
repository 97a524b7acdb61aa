#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace clashvision::vision {

/// Raw model output copied out of the runtime, before decoding to boxes.
/// Row-major; shape is the logical tensor shape, e.g. (1, attributes, candidates).
struct RawTensor {
  std::string name;
  std::vector<std::int64_t> shape;
  std::vector<float> data;

  /// Product of the shape dims; 0 if any dim is non-positive or shape is empty.
  [[nodiscard]] std::size_t element_count() const noexcept {
    if (shape.empty()) return 0;
    std::size_t n = 1;
    for (const auto d : shape) {
      if (d <= 0) return 0;
      n *= static_cast<std::size_t>(d);
    }
    return n;
  }
};

}  // namespace clashvision::vision
