#pragma once

#include <vigil/app/config.hpp>
#include <vigil/core/model_config.hpp>
#include <vigil/vision/detection_model.hpp>
#include <vigil/vision/inference_backend.hpp>
#include <vigil/vision/labels.hpp>
#include <vigil/vision/object_detector.hpp>
#include <memory>

namespace vigil::app {

/// Create the inference backend named by \p cfg.backend_type.
/// Onnx loads cfg.model.model_path (throws if it cannot be loaded). Mock returns a backend
/// preloaded with one synthetic detection of class 0 for the configured model kind.
[[nodiscard]] std::unique_ptr<vigil::vision::IInferenceBackend> make_inference_backend(
    const AppConfig& cfg, const vigil::vision::LabelList& labels);

/// Select the detection strategy for config->kind. Throws ConfigurationError when the
/// backend does not expose the configured tensors.
[[nodiscard]] std::unique_ptr<vigil::vision::IDetectionModel> make_detection_model(
    std::shared_ptr<const vigil::core::ModelConfig> config,
    std::shared_ptr<const vigil::vision::LabelList> labels,
    std::unique_ptr<vigil::vision::IInferenceBackend> backend);

/// Validate the configuration, load labels and model, warm up, and return a ready detector.
/// Throws ConfigurationError listing every problem found.
[[nodiscard]] std::unique_ptr<vigil::vision::ObjectDetector> make_object_detector(
    const AppConfig& cfg);

}  // namespace vigil::app
