#pragma once

#include <vigil/core/model_config.hpp>
#include <vigil/vision/detection_model.hpp>
#include <vigil/vision/inference_backend.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/preprocessor.hpp>
#include <vigil/vision/tiny_yolov3_decoder.hpp>
#include <memory>

namespace vigil::vision {

/// Tiny YOLOv3 (ONNX model zoo export with built-in NMS layer).
///
/// Inputs: "image" [1, 3, S, S] RGB in [0, 1], "shape" [1, 2] = (height, width) of the
/// original image. Outputs: "boxes" [1, N, 4] (y1, x1, y2, x2) in original pixels and
/// "scores" [1, C, N].
class TinyYoloV3Model : public IDetectionModel {
 public:
  /// Throws std::runtime_error if the backend declares inputs/outputs that do not include
  /// the configured tensor names.
  TinyYoloV3Model(std::shared_ptr<const vigil::core::ModelConfig> config,
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

  [[nodiscard]] std::string_view name() const noexcept override { return "tiny_yolov3"; }

 private:
  std::shared_ptr<const vigil::core::ModelConfig> config_;
  std::unique_ptr<IInferenceBackend> backend_;
  Preprocessor preprocessor_;
  TinyYoloV3Decoder decoder_;
  std::string image_input_;
  std::string shape_input_;
  std::vector<std::string> outputs_;  // {boxes, scores}
};

}  // namespace vigil::vision
