#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/tensor.hpp>
#include <vigil/vision/inference_backend.hpp>
#include <memory>
#include <string>

namespace vigil::vision {

/// ONNX Runtime inference backend: loads an ONNX model and implements IInferenceBackend.
///
/// The environment and session live as long as this object and are released once, in the
/// destructor. Input and output metadata (names, declared shapes) are read at construction
/// and logged at debug level. Only float32 inputs and outputs are supported.
///
/// run() keeps no per-call state in the backend, so it may be called from several threads
/// at once (ONNX Runtime sessions support concurrent Run).
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param intra_op_threads Threads per run; 0 lets ONNX Runtime decide.
  /// Throws Ort::Exception if the model cannot be loaded, std::runtime_error if it
  /// declares no inputs or outputs.
  explicit OnnxInferenceBackend(std::string model_path, int intra_op_threads = 1);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<vigil::core::NamedTensors, vigil::core::DetectionError>
  run(const vigil::core::NamedTensors& inputs,
      std::span<const std::string> output_names) override;

  [[nodiscard]] std::vector<std::string> input_names() const override;
  [[nodiscard]] std::vector<std::string> output_names() const override;
  [[nodiscard]] std::optional<std::vector<std::int64_t>> output_shape(
      const std::string& name) const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vigil::vision
