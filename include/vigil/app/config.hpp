#pragma once

#include <vigil/core/model_config.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace vigil::app {

/// Startup configuration failure (invalid values, missing files or tensors). Fatal.
class ConfigurationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Inference backend type: onnx (real model) or mock (synthetic outputs, demo/tests).
enum class InferenceBackendType {
  Onnx,
  Mock,
};

/// Application configuration: model config plus runtime options.
struct AppConfig {
  vigil::core::ModelConfig model;
  InferenceBackendType backend_type{InferenceBackendType::Onnx};
  std::size_t batch_workers{1};  // 0 = hardware concurrency
  std::string log_level{"info"};
};

/// Load config from a key=value file (one per line, '#' comments).
/// "model_kind" selects the default set; every other key overrides it.
/// Throws ConfigurationError if the file cannot be read or a value does not parse.
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Default config when no file is provided (Tiny YOLOv3, ONNX backend).
[[nodiscard]] AppConfig default_config();

}  // namespace vigil::app
