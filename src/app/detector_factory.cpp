#include <vigil/app/detector_factory.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/tensor.hpp>
#include <vigil/vision/mock_inference_backend.hpp>
#include <vigil/vision/onnx_inference_backend.hpp>
#include <vigil/vision/tiny_yolov3_model.hpp>
#include <vigil/vision/yolov4_model.hpp>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace vigil::app {

namespace {

namespace vc = vigil::core;
namespace vv = vigil::vision;

std::string join_failures(const std::vector<std::string>& failures) {
  std::string msg = "Invalid model configuration:";
  for (const auto& f : failures) {
    msg += "\n  ";
    msg += f;
  }
  return msg;
}

/// One box (x 10..110, y 20..120 in original pixels), class 0 at 0.9.
vc::NamedTensors tiny_yolov3_demo_outputs(const vc::ModelConfig& m, std::size_t num_classes) {
  const auto classes = static_cast<std::int64_t>(num_classes);
  vc::Tensor boxes(std::vector<std::int64_t>{1, 1, 4}, std::vector<float>{20.f, 10.f, 120.f, 110.f});
  vc::Tensor scores(std::vector<std::int64_t>{1, classes, 1});
  scores.at({0, 0, 0}) = 0.9f;

  vc::NamedTensors out;
  out.emplace(m.boxes_output_names().front(), std::move(boxes));
  out.emplace(m.scores_output_names().front(), std::move(scores));
  return out;
}

/// Class-last grids for every layer; the centre cell of layer 0 scores class 0 at 0.9.
vc::NamedTensors yolov4_demo_outputs(const vc::ModelConfig& m, std::size_t num_classes) {
  const auto boxes_names = m.boxes_output_names();
  const auto scores_names = m.scores_output_names();
  const auto classes = static_cast<std::int64_t>(num_classes);
  const auto anchors = static_cast<std::int64_t>(
      m.strides.empty() ? 0 : m.anchors.size() / (2 * m.strides.size()));

  vc::NamedTensors out;
  for (std::size_t l = 0; l < boxes_names.size() && l < m.strides.size(); ++l) {
    const auto grid = static_cast<std::int64_t>(
        std::ceil(static_cast<float>(m.image_size) / m.strides[l]));
    vc::Tensor boxes(std::vector<std::int64_t>{1, grid, grid, anchors, 4});
    vc::Tensor scores(std::vector<std::int64_t>{1, grid, grid, anchors, classes});
    if (l == 0 && anchors > 0 && classes > 0) {
      scores.at({0, grid / 2, grid / 2, 0, 0}) = 0.9f;
    }
    out.emplace(boxes_names[l], std::move(boxes));
    out.emplace(scores_names[l], std::move(scores));
  }
  return out;
}

}  // namespace

std::unique_ptr<vv::IInferenceBackend> make_inference_backend(const AppConfig& cfg,
                                                              const vv::LabelList& labels) {
  if (cfg.backend_type == InferenceBackendType::Onnx) {
    if (cfg.model.model_path.empty()) {
      throw ConfigurationError("backend_type=onnx requires model_path to be set in config");
    }
    return std::make_unique<vv::OnnxInferenceBackend>(cfg.model.model_path);
  }

  auto mock = std::make_unique<vv::MockInferenceBackend>();
  std::vector<std::string> inputs;
  for (const auto& [key, name] : cfg.model.input_tensors) inputs.push_back(name);
  mock->set_input_names(std::move(inputs));
  mock->set_outputs(cfg.model.kind == vc::ModelKind::YoloV4
                        ? yolov4_demo_outputs(cfg.model, labels.size())
                        : tiny_yolov3_demo_outputs(cfg.model, labels.size()));
  return mock;
}

std::unique_ptr<vv::IDetectionModel> make_detection_model(
    std::shared_ptr<const vc::ModelConfig> config,
    std::shared_ptr<const vv::LabelList> labels,
    std::unique_ptr<vv::IInferenceBackend> backend) {
  if (!config || !labels || !backend) {
    throw std::invalid_argument("make_detection_model: config, labels and backend are required");
  }
  try {
    switch (config->kind) {
      case vc::ModelKind::YoloV4:
        return std::make_unique<vv::YoloV4Model>(std::move(config), std::move(labels),
                                                 std::move(backend));
      case vc::ModelKind::TinyYoloV3:
        break;
    }
    return std::make_unique<vv::TinyYoloV3Model>(std::move(config), std::move(labels),
                                                 std::move(backend));
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(e.what());
  }
}

std::unique_ptr<vv::ObjectDetector> make_object_detector(const AppConfig& cfg) {
  auto log = vc::get_logger("factory");

  std::vector<std::string> failures = vc::validate(cfg.model);
  if (cfg.backend_type == InferenceBackendType::Mock) {
    // The mock needs no model file.
    std::erase_if(failures, [](const std::string& f) { return f.starts_with("model_path:"); });
  }
  if (!failures.empty()) {
    for (const auto& f : failures) log->error("Configuration error: {}", f);
    throw ConfigurationError(join_failures(failures));
  }

  std::shared_ptr<const vv::LabelList> labels;
  try {
    labels = std::make_shared<const vv::LabelList>(vv::load_labels(cfg.model.labels_path));
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(e.what());
  }
  log->info("Loaded {} labels from {}", labels->size(), cfg.model.labels_path);

  std::unique_ptr<vv::IInferenceBackend> backend;
  try {
    backend = make_inference_backend(cfg, *labels);
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::exception& e) {
    throw ConfigurationError(std::string("Failed to load model: ") + e.what());
  }

  auto config = std::make_shared<const vc::ModelConfig>(cfg.model);
  auto model = make_detection_model(config, labels, std::move(backend));
  log->info("Model {} ready (image_size={}, confidence_threshold={}, iou_threshold={})",
            model->name(), config->image_size, config->confidence_threshold,
            config->iou_threshold);
  model->warmup();

  return std::make_unique<vv::ObjectDetector>(std::move(model), config->iou_threshold);
}

}  // namespace vigil::app
