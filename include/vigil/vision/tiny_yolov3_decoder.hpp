#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/model_config.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/raw_model_output.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <vector>

namespace vigil::vision {

/// Decodes Tiny YOLOv3 NMS-layer outputs into candidates.
///
/// Expects one layer: boxes [1, N, 4] as (y1, x1, y2, x2) already mapped to original image
/// pixels by the model (via its image_shape input), scores [1, C, N]. For every box the best
/// class is the first one with the maximum score; boxes whose best score is below the
/// confidence threshold are dropped. Boxes are scaled into the configured display space.
class TinyYoloV3Decoder {
 public:
  TinyYoloV3Decoder(std::shared_ptr<const vigil::core::ModelConfig> config,
                    std::shared_ptr<const LabelList> labels);

  /// DetectionError::Decoding on unexpected tensor shapes or more classes than labels.
  [[nodiscard]] std::expected<std::vector<vigil::core::CandidateDetection>,
                              vigil::core::DetectionError>
  decode(const RawModelOutput& output,
         std::uint32_t original_width,
         std::uint32_t original_height) const;

 private:
  std::shared_ptr<const vigil::core::ModelConfig> config_;
  std::shared_ptr<const LabelList> labels_;
  std::shared_ptr<spdlog::logger> log_;
};

}  // namespace vigil::vision
