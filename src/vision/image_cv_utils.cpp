#include "image_cv_utils.hpp"
#include <vigil/core/image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace vigil::vision::detail {

namespace vc = vigil::core;

std::optional<cv::Mat> image_to_mat(const vc::Image& image) {
  if (!image.valid()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  const std::size_t step =
      static_cast<std::size_t>(image.width()) * vc::Image::channels(image.format());
  auto* ptr = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case vc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, ptr, step);
    case vc::PixelFormat::RGB8:
    case vc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, ptr, step);
    case vc::PixelFormat::RGBA8:
    case vc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, ptr, step);
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

vc::Image mat_to_image(const cv::Mat& mat, vc::PixelFormat format) {
  if (mat.empty()) return vc::Image();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return vc::Image(static_cast<std::uint32_t>(packed.cols),
                   static_cast<std::uint32_t>(packed.rows), format, std::move(buffer));
}

std::optional<cv::Mat> to_rgb(const vc::Image& image) {
  auto mat = image_to_mat(image);
  if (!mat) return std::nullopt;

  int code = -1;
  switch (image.format()) {
    case vc::PixelFormat::RGB8:
      return mat->clone();
    case vc::PixelFormat::BGR8:
      code = cv::COLOR_BGR2RGB;
      break;
    case vc::PixelFormat::RGBA8:
      code = cv::COLOR_RGBA2RGB;
      break;
    case vc::PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2RGB;
      break;
    case vc::PixelFormat::Grayscale8:
      code = cv::COLOR_GRAY2RGB;
      break;
    case vc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }

  cv::Mat rgb;
  cv::cvtColor(*mat, rgb, code);
  return rgb;
}

}  // namespace vigil::vision::detail
