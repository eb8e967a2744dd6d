#include <vigil/vision/tiny_yolov3_model.hpp>
#include "model_utils.hpp"
#include <vigil/core/logging.hpp>
#include <stdexcept>

namespace vigil::vision {

namespace vc = vigil::core;

TinyYoloV3Model::TinyYoloV3Model(std::shared_ptr<const vc::ModelConfig> config,
                                 std::shared_ptr<const LabelList> labels,
                                 std::unique_ptr<IInferenceBackend> backend)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      preprocessor_(config_->image_size, InputLayout::Nchw),
      decoder_(config_, std::move(labels)),
      image_input_(config_->image_input_name()),
      shape_input_(config_->shape_input_name()) {
  const auto boxes = config_->boxes_output_names();
  const auto scores = config_->scores_output_names();
  if (boxes.size() != 1 || scores.size() != 1) {
    throw std::runtime_error("Tiny YOLOv3 needs exactly one boxes and one scores output");
  }
  outputs_ = {boxes.front(), scores.front()};

  const std::vector<std::string> inputs{image_input_, shape_input_};
  detail::require_declared(backend_->input_names(), inputs, "input");
  detail::require_declared(backend_->output_names(), outputs_, "output");
}

std::expected<PreprocessedInput, vc::DetectionError> TinyYoloV3Model::preprocess(
    const vc::Image& image) const {
  return preprocessor_.process(image);
}

std::expected<RawModelOutput, vc::DetectionError> TinyYoloV3Model::run_inference(
    const PreprocessedInput& input) const {
  vc::NamedTensors inputs;
  inputs.emplace(image_input_, input.input);
  inputs.emplace(shape_input_, input.shape);

  auto outputs = backend_->run(inputs, outputs_);
  if (!outputs) {
    vc::get_logger("tiny_yolov3")->error("Error running model inference");
    return std::unexpected(outputs.error());
  }
  return detail::collect_layers(*outputs, std::span(outputs_).first(1),
                                std::span(outputs_).last(1), "tiny_yolov3");
}

std::expected<std::vector<vc::CandidateDetection>, vc::DetectionError>
TinyYoloV3Model::decode_outputs(const RawModelOutput& output,
                                std::uint32_t original_width,
                                std::uint32_t original_height) const {
  return decoder_.decode(output, original_width, original_height);
}

}  // namespace vigil::vision
