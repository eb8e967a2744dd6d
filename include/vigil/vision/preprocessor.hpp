#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/geometry.hpp>
#include <vigil/core/image.hpp>
#include <vigil/core/tensor.hpp>
#include <cstdint>
#include <expected>

namespace vigil::vision {

/// Axis order of the network input tensor.
enum class InputLayout : std::uint8_t {
  Nchw,  // [1, 3, H, W] (Tiny YOLOv3)
  Nhwc,  // [1, H, W, 3] (YOLOv4)
};

/// Network input produced for one image; discarded after inference.
struct PreprocessedInput {
  vigil::core::Tensor input;  // RGB, values in [0, 1]
  vigil::core::Tensor shape;  // [1, 2] = (original height, original width)
  vigil::core::LetterboxTransform letterbox{};
  std::uint32_t original_width{0};
  std::uint32_t original_height{0};
};

/// Letterboxes an image into a target_size x target_size black canvas (aspect ratio kept,
/// resized image centered) and writes it as a normalized float tensor.
/// Stateless; safe to call from several threads.
class Preprocessor {
 public:
  Preprocessor(std::uint32_t target_size, InputLayout layout);

  /// DetectionError::InvalidImage for zero dimensions, unknown format, short buffer,
  /// or an OpenCV failure.
  [[nodiscard]] std::expected<PreprocessedInput, vigil::core::DetectionError> process(
      const vigil::core::Image& image) const;

  [[nodiscard]] std::uint32_t target_size() const noexcept { return target_size_; }
  [[nodiscard]] InputLayout layout() const noexcept { return layout_; }

 private:
  std::uint32_t target_size_;
  InputLayout layout_;
};

}  // namespace vigil::vision
