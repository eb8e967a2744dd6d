#pragma once

#include <vigil/core/detection.hpp>
#include <cstdint>

namespace vigil::core {

/// Intersection over union of two boxes. 0 when they do not overlap (or the union is empty).
[[nodiscard]] float intersection_over_union(const BBox& a, const BBox& b) noexcept;

/// Aspect-preserving fit of an image into a target_size x target_size network input.
/// The resized image sits centered on a black canvas at (x_pad, y_pad).
struct LetterboxTransform {
  float scale{1.f};
  std::uint32_t target_size{0};
  std::uint32_t new_width{0};
  std::uint32_t new_height{0};
  std::uint32_t x_pad{0};
  std::uint32_t y_pad{0};

  /// Network-input x -> original image x.
  [[nodiscard]] float to_original_x(float x) const noexcept {
    return (x - static_cast<float>(x_pad)) / scale;
  }
  /// Network-input y -> original image y.
  [[nodiscard]] float to_original_y(float y) const noexcept {
    return (y - static_cast<float>(y_pad)) / scale;
  }
};

/// scale = min(target/width, target/height); new size rounded and clamped to [1, target].
/// Width and height must be > 0.
[[nodiscard]] LetterboxTransform compute_letterbox(std::uint32_t width,
                                                   std::uint32_t height,
                                                   std::uint32_t target_size) noexcept;

/// Factors mapping original-image pixels to the target coordinate space.
struct ScaleFactors {
  float x{1.f};
  float y{1.f};
};

/// target_width/height of 0 means "original image pixels" (factors 1, 1).
[[nodiscard]] ScaleFactors target_scale(std::uint32_t target_width,
                                        std::uint32_t target_height,
                                        std::uint32_t original_width,
                                        std::uint32_t original_height) noexcept;

}  // namespace vigil::core
