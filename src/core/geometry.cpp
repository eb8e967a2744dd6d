#include <vigil/core/geometry.hpp>
#include <algorithm>
#include <cmath>

namespace vigil::core {

float intersection_over_union(const BBox& a, const BBox& b) noexcept {
  const float left = std::max(a.x, b.x);
  const float top = std::max(a.y, b.y);
  const float inter_w = std::min(a.right(), b.right()) - left;
  const float inter_h = std::min(a.bottom(), b.bottom()) - top;
  if (inter_w <= 0.f || inter_h <= 0.f) {
    return 0.f;
  }
  const float inter = inter_w * inter_h;
  const float uni = a.area() + b.area() - inter;
  if (uni <= 0.f) {
    return 0.f;
  }
  return inter / uni;
}

LetterboxTransform compute_letterbox(std::uint32_t width,
                                     std::uint32_t height,
                                     std::uint32_t target_size) noexcept {
  LetterboxTransform t;
  t.target_size = target_size;
  const float target = static_cast<float>(target_size);
  t.scale = std::min(target / static_cast<float>(width),
                     target / static_cast<float>(height));

  const auto fit = [target_size](float v) {
    const long r = std::lround(v);
    return static_cast<std::uint32_t>(
        std::clamp<long>(r, 1, static_cast<long>(target_size)));
  };
  t.new_width = fit(static_cast<float>(width) * t.scale);
  t.new_height = fit(static_cast<float>(height) * t.scale);
  t.x_pad = (target_size - t.new_width) / 2;
  t.y_pad = (target_size - t.new_height) / 2;
  return t;
}

ScaleFactors target_scale(std::uint32_t target_width,
                          std::uint32_t target_height,
                          std::uint32_t original_width,
                          std::uint32_t original_height) noexcept {
  if (target_width == 0 || target_height == 0 || original_width == 0 ||
      original_height == 0) {
    return {};
  }
  return {static_cast<float>(target_width) / static_cast<float>(original_width),
          static_cast<float>(target_height) / static_cast<float>(original_height)};
}

}  // namespace vigil::core
