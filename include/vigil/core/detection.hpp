#pragma once

#include <cstddef>
#include <string>

namespace vigil::core {

/// Axis-aligned bounding box: top-left corner plus size, in pixels of some coordinate space.
struct BBox {
  float x{0.f};
  float y{0.f};
  float width{0.f};
  float height{0.f};

  [[nodiscard]] float right() const noexcept { return x + width; }
  [[nodiscard]] float bottom() const noexcept { return y + height; }
  [[nodiscard]] float area() const noexcept { return width * height; }
};

/// Final detection handed to the caller. Box is in the configured target space
/// (original image pixels, or the fixed display resolution when one is configured).
struct DetectionResult {
  std::string label;
  float confidence{0.f};
  BBox bounding_box{};
};

/// Pre-suppression candidate produced by a model decoder.
struct CandidateDetection {
  std::size_t class_id{0};
  std::string label;
  float confidence{0.f};
  BBox box{};

  [[nodiscard]] DetectionResult to_result() const {
    return DetectionResult{label, confidence, box};
  }
};

}  // namespace vigil::core
