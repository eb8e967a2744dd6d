#include <vigil/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <vigil/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace vigil::vision {

namespace {

std::optional<vigil::core::Image> from_decoded(const cv::Mat& mat) {
  if (mat.empty()) return std::nullopt;

  vigil::core::PixelFormat format = vigil::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = vigil::core::PixelFormat::Grayscale8;

  return detail::mat_to_image(mat, format);
}

}  // namespace

std::optional<vigil::core::Image> load_image(const std::string& path) {
  return from_decoded(cv::imread(path, cv::IMREAD_COLOR));
}

std::optional<vigil::core::Image> decode_image(std::span<const std::byte> encoded) {
  if (encoded.empty()) return std::nullopt;
  const cv::Mat raw(1, static_cast<int>(encoded.size()), CV_8UC1,
                    const_cast<std::byte*>(encoded.data()));
  try {
    return from_decoded(cv::imdecode(raw, cv::IMREAD_COLOR));
  } catch (const cv::Exception&) {
    return std::nullopt;
  }
}

}  // namespace vigil::vision
