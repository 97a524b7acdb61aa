#pragma once

#include <cstddef>
#include <span>

#ifdef CLASHVISION_HAS_EMBEDDED_MODEL

namespace clashvision::app {

/// ONNX model compiled into the binary (CMake option CLASHVISION_EMBEDDED_MODEL).
[[nodiscard]] std::span<const std::byte> embedded_model() noexcept;

}  // namespace clashvision::app

#endif  // CLASHVISION_HAS_EMBEDDED_MODEL
