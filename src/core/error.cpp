#include <vigil/core/error.hpp>

namespace vigil::core {

std::string_view to_string(DetectionError error) noexcept {
  switch (error) {
    case DetectionError::None:
      return "None";
    case DetectionError::InvalidImage:
      return "InvalidImage";
    case DetectionError::ModelConfiguration:
      return "ModelConfiguration";
    case DetectionError::Inference:
      return "Inference";
    case DetectionError::Decoding:
      return "Decoding";
  }
  return "Unknown";
}

}  // namespace vigil::core
