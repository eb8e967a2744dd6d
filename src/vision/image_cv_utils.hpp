#pragma once

#include <vigil/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace vigil::vision::detail {

/// Wrap an Image as a cv::Mat (shared view, no copy). Returns nullopt if the image is
/// invalid or its format unsupported.
std::optional<cv::Mat> image_to_mat(const vigil::core::Image& image);

/// Convert cv::Mat (8-bit, 1/3/4 channels) to Image (copy).
vigil::core::Image mat_to_image(const cv::Mat& mat, vigil::core::PixelFormat format);

/// 3-channel RGB copy of the image, converting from its pixel format.
std::optional<cv::Mat> to_rgb(const vigil::core::Image& image);

}  // namespace vigil::vision::detail
