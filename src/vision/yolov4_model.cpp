#include <vigil/vision/yolov4_model.hpp>
#include "model_utils.hpp"
#include <vigil/core/logging.hpp>
#include <stdexcept>

namespace vigil::vision {

namespace vc = vigil::core;

namespace {

vc::TensorLayout resolve_score_layout(const vc::ModelConfig& config,
                                      const LabelList& labels,
                                      const IInferenceBackend& backend) {
  if (config.score_layout) {
    return *config.score_layout;
  }
  const auto names = config.scores_output_names();
  if (names.empty()) {
    throw std::runtime_error("YOLOv4 configuration has no scores outputs");
  }
  const auto shape = backend.output_shape(names.front());
  if (!shape) {
    throw std::runtime_error("YOLOv4: model does not declare a shape for output '" +
                             names.front() + "'; set score_layout explicitly");
  }
  const auto layout = detect_score_layout(*shape, labels.size());
  if (!layout) {
    throw std::runtime_error("YOLOv4: cannot resolve scores layout from shape " +
                             vc::shape_to_string(*shape) + "; set score_layout explicitly");
  }
  vc::get_logger("yolov4")->debug(
      "Scores layout resolved from {}: {}", vc::shape_to_string(*shape),
      *layout == vc::TensorLayout::ClassFirst ? "class_first" : "class_last");
  return *layout;
}

}  // namespace

YoloV4Model::YoloV4Model(std::shared_ptr<const vc::ModelConfig> config,
                         std::shared_ptr<const LabelList> labels,
                         std::unique_ptr<IInferenceBackend> backend)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      preprocessor_(config_->image_size, InputLayout::Nhwc),
      decoder_(config_, labels, resolve_score_layout(*config_, *labels, *backend_)),
      image_input_(config_->image_input_name()),
      boxes_outputs_(config_->boxes_output_names()),
      scores_outputs_(config_->scores_output_names()) {
  if (boxes_outputs_.empty() || boxes_outputs_.size() != scores_outputs_.size()) {
    throw std::runtime_error("YOLOv4 needs one boxes and one scores output per layer");
  }
  all_outputs_ = boxes_outputs_;
  all_outputs_.insert(all_outputs_.end(), scores_outputs_.begin(), scores_outputs_.end());

  const std::vector<std::string> inputs{image_input_};
  detail::require_declared(backend_->input_names(), inputs, "input");
  detail::require_declared(backend_->output_names(), all_outputs_, "output");
}

std::expected<PreprocessedInput, vc::DetectionError> YoloV4Model::preprocess(
    const vc::Image& image) const {
  return preprocessor_.process(image);
}

std::expected<RawModelOutput, vc::DetectionError> YoloV4Model::run_inference(
    const PreprocessedInput& input) const {
  vc::NamedTensors inputs;
  inputs.emplace(image_input_, input.input);

  auto outputs = backend_->run(inputs, all_outputs_);
  if (!outputs) {
    vc::get_logger("yolov4")->error("Error running model inference");
    return std::unexpected(outputs.error());
  }
  return detail::collect_layers(*outputs, boxes_outputs_, scores_outputs_, "yolov4");
}

std::expected<std::vector<vc::CandidateDetection>, vc::DetectionError>
YoloV4Model::decode_outputs(const RawModelOutput& output,
                            std::uint32_t original_width,
                            std::uint32_t original_height) const {
  return decoder_.decode(output, original_width, original_height);
}

}  // namespace vigil::vision
