#pragma once

#include <vigil/core/image.hpp>
#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace vigil::vision {

/// Load an image file into an Image (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<vigil::core::Image> load_image(const std::string& path);

/// Decode encoded image bytes (PNG, JPEG, BMP, ...) into an Image (BGR8 or Grayscale8).
/// Returns nullopt when the bytes are not a decodable image.
std::optional<vigil::core::Image> decode_image(std::span<const std::byte> encoded);

}  // namespace vigil::vision
