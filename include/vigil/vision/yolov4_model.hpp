#pragma once

#include <vigil/core/model_config.hpp>
#include <vigil/vision/detection_model.hpp>
#include <vigil/vision/inference_backend.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/preprocessor.hpp>
#include <vigil/vision/yolov4_decoder.hpp>
#include <memory>

namespace vigil::vision {

/// YOLOv4 with raw per-layer outputs (no built-in NMS).
///
/// Input: "image" [1, S, S, 3] RGB in [0, 1]; the shape tensor is produced but not sent.
/// Outputs: one boxes/scores pair per stride. The scores layout is taken from the config
/// or resolved here, once, from the backend's declared output shape.
class YoloV4Model : public IDetectionModel {
 public:
  /// Throws std::runtime_error on unknown tensor names or an unresolvable scores layout.
  YoloV4Model(std::shared_ptr<const vigil::core::ModelConfig> config,
              std::shared_ptr<const LabelList> labels,
              std::unique_ptr<IInferenceBackend> backend);

  [[nodiscard]] std::expected<PreprocessedInput, vigil::core::DetectionError>
  preprocess(const vigil::core::Image& image) const override;

  [[nodiscard]] std::expected<RawModelOutput, vigil::core::DetectionError>
  run_inference(const PreprocessedInput& input) const override;

  [[nodiscard]] std::expected<std::vector<vigil::core::CandidateDetection>,
                              vigil::core::DetectionError>
  decode_outputs(const RawModelOutput& output,
                 std::uint32_t original_width,
                 std::uint32_t original_height) const override;

  [[nodiscard]] std::string_view name() const noexcept override { return "yolov4"; }

  [[nodiscard]] vigil::core::TensorLayout score_layout() const noexcept {
    return decoder_.score_layout();
  }

 private:
  std::shared_ptr<const vigil::core::ModelConfig> config_;
  std::unique_ptr<IInferenceBackend> backend_;
  Preprocessor preprocessor_;
  YoloV4Decoder decoder_;
  std::string image_input_;
  std::vector<std::string> boxes_outputs_;
  std::vector<std::string> scores_outputs_;
  std::vector<std::string> all_outputs_;
};

}  // namespace vigil::vision
