#include <vigil/vision/preprocessor.hpp>
#include "image_cv_utils.hpp"
#include <vigil/core/logging.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>

namespace vigil::vision {

namespace vc = vigil::core;

namespace {

constexpr float kPixelScale = 1.f / 255.f;

/// Copy an 8-bit RGB canvas into the tensor, normalized to [0, 1].
void fill_tensor(const cv::Mat& canvas, InputLayout layout, vc::Tensor& tensor) {
  const auto size = static_cast<std::size_t>(canvas.rows);
  const std::size_t plane = size * size;
  float* out = tensor.data().data();

  for (int y = 0; y < canvas.rows; ++y) {
    const auto* row = canvas.ptr<cv::Vec3b>(y);
    for (int x = 0; x < canvas.cols; ++x) {
      const std::size_t pixel = static_cast<std::size_t>(y) * size + static_cast<std::size_t>(x);
      for (std::size_t c = 0; c < 3; ++c) {
        const float v = static_cast<float>(row[x][static_cast<int>(c)]) * kPixelScale;
        if (layout == InputLayout::Nchw) {
          out[c * plane + pixel] = v;
        } else {
          out[pixel * 3 + c] = v;
        }
      }
    }
  }
}

}  // namespace

Preprocessor::Preprocessor(std::uint32_t target_size, InputLayout layout)
    : target_size_(target_size), layout_(layout) {}

std::expected<PreprocessedInput, vc::DetectionError> Preprocessor::process(
    const vc::Image& image) const {
  if (!image.valid() || target_size_ == 0) {
    vc::get_logger("preprocess")
        ->error("Invalid image: {}x{}, {} bytes", image.width(), image.height(),
                image.size_bytes());
    return std::unexpected(vc::DetectionError::InvalidImage);
  }

  const vc::LetterboxTransform letterbox =
      vc::compute_letterbox(image.width(), image.height(), target_size_);
  const auto side = static_cast<std::int64_t>(target_size_);

  PreprocessedInput out;
  out.letterbox = letterbox;
  out.original_width = image.width();
  out.original_height = image.height();
  out.shape = vc::Tensor({1, 2}, {static_cast<float>(image.height()),
                                  static_cast<float>(image.width())});
  out.input = layout_ == InputLayout::Nchw ? vc::Tensor({1, 3, side, side})
                                           : vc::Tensor({1, side, side, 3});

  try {
    auto rgb = detail::to_rgb(image);
    if (!rgb) {
      return std::unexpected(vc::DetectionError::InvalidImage);
    }

    cv::Mat resized;
    cv::resize(*rgb, resized,
               cv::Size(static_cast<int>(letterbox.new_width),
                        static_cast<int>(letterbox.new_height)),
               0, 0, cv::INTER_LINEAR);

    cv::Mat canvas = cv::Mat::zeros(static_cast<int>(target_size_),
                                    static_cast<int>(target_size_), CV_8UC3);
    resized.copyTo(canvas(cv::Rect(static_cast<int>(letterbox.x_pad),
                                   static_cast<int>(letterbox.y_pad),
                                   resized.cols, resized.rows)));

    fill_tensor(canvas, layout_, out.input);
  } catch (const cv::Exception& e) {
    vc::get_logger("preprocess")->error("Error preprocessing image: {}", e.what());
    return std::unexpected(vc::DetectionError::InvalidImage);
  }
  return out;
}

}  // namespace vigil::vision
