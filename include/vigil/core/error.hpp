#pragma once

#include <string_view>

namespace vigil::core {

/// Detection error codes; used with std::expected for per-frame failures.
enum class DetectionError {
  None = 0,
  InvalidImage,
  ModelConfiguration,
  Inference,
  Decoding,
};

/// Stable name for logs and CLI output.
[[nodiscard]] std::string_view to_string(DetectionError error) noexcept;

}  // namespace vigil::core
