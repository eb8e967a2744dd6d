#pragma once

#include <vigil/vision/inference_backend.hpp>
#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace vigil::vision {

/// Mock backend that returns configurable output tensors (for tests/demo).
/// Records the inputs of the last run() call.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Outputs to return from run(); the names double as the declared output names.
  void set_outputs(vigil::core::NamedTensors outputs);

  /// Declared input names reported by input_names().
  void set_input_names(std::vector<std::string> names);

  /// Override the declared shape of one output (defaults to the shape of the set tensor).
  void set_output_shape(const std::string& name, std::vector<std::int64_t> shape);

  /// When true, run() fails with DetectionError::Inference.
  void set_fail(bool fail);

  [[nodiscard]] std::expected<vigil::core::NamedTensors, vigil::core::DetectionError>
  run(const vigil::core::NamedTensors& inputs,
      std::span<const std::string> output_names) override;

  [[nodiscard]] std::vector<std::string> input_names() const override;
  [[nodiscard]] std::vector<std::string> output_names() const override;
  [[nodiscard]] std::optional<std::vector<std::int64_t>> output_shape(
      const std::string& name) const override;

  [[nodiscard]] vigil::core::NamedTensors last_inputs() const;
  [[nodiscard]] std::size_t run_count() const;

 private:
  mutable std::mutex mutex_;
  vigil::core::NamedTensors outputs_;
  std::vector<std::string> input_names_;
  std::unordered_map<std::string, std::vector<std::int64_t>> declared_shapes_;
  vigil::core::NamedTensors last_inputs_;
  std::size_t run_count_{0};
  bool fail_{false};
};

}  // namespace vigil::vision
