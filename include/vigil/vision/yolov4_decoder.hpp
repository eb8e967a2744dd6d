#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/model_config.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/raw_model_output.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace vigil::vision {

/// Resolve the scores layout from a declared [1, ?, ?, ?, ?] shape.
/// A dim equal to num_classes at axis 4 (and not axis 1) means class-last, the reverse
/// means class-first; otherwise the larger of axis 1 and axis 4 is taken as the class axis.
/// nullopt if the shape is not rank 5 or both candidate axes are dynamic.
[[nodiscard]] std::optional<vigil::core::TensorLayout> detect_score_layout(
    std::span<const std::int64_t> shape,
    std::size_t num_classes) noexcept;

/// Decodes YOLOv4 anchor-grid outputs into candidates in original image pixels
/// (scaled into the display space when one is configured).
///
/// Per layer l: boxes [1, H, W, A, 4+] hold raw (tx, ty, tw, th); scores are
/// [1, H, W, A, C] (class-last) or [1, C, H, W, A] (class-first). For each cell and anchor:
///   x = (sigmoid(tx) * xyscale - 0.5 * (xyscale - 1) + grid_x) * stride
///   w = exp(tw) * anchor_w
/// then corners are mapped back through the preprocessing letterbox, clipped to the image,
/// and degenerate boxes dropped. All layers feed one candidate list.
class YoloV4Decoder {
 public:
  YoloV4Decoder(std::shared_ptr<const vigil::core::ModelConfig> config,
                std::shared_ptr<const LabelList> labels,
                vigil::core::TensorLayout score_layout);

  /// DetectionError::Decoding on a layer count, tensor shape, or class count mismatch.
  [[nodiscard]] std::expected<std::vector<vigil::core::CandidateDetection>,
                              vigil::core::DetectionError>
  decode(const RawModelOutput& output,
         std::uint32_t original_width,
         std::uint32_t original_height) const;

  [[nodiscard]] vigil::core::TensorLayout score_layout() const noexcept {
    return score_layout_;
  }

 private:
  std::shared_ptr<const vigil::core::ModelConfig> config_;
  std::shared_ptr<const LabelList> labels_;
  vigil::core::TensorLayout score_layout_;
  std::size_t anchors_per_layer_;
  std::shared_ptr<spdlog::logger> log_;
};

}  // namespace vigil::vision
