#pragma once

#include <vigil/core/error.hpp>
#include <vigil/core/tensor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace vigil::vision {

/// Abstract inference engine: named float32 input tensors -> named float32 output tensors.
/// The engine is a black box; only this calling contract is relied on.
/// Implementations must allow concurrent run() calls once constructed.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Run the model once. Returns exactly the requested outputs, or DetectionError::Inference.
  [[nodiscard]] virtual std::expected<vigil::core::NamedTensors, vigil::core::DetectionError>
  run(const vigil::core::NamedTensors& inputs,
      std::span<const std::string> output_names) = 0;

  /// Declared model input names (empty if the engine does not report them).
  [[nodiscard]] virtual std::vector<std::string> input_names() const = 0;

  /// Declared model output names (empty if the engine does not report them).
  [[nodiscard]] virtual std::vector<std::string> output_names() const = 0;

  /// Declared shape of an output; dynamic dims are -1. nullopt if unknown.
  [[nodiscard]] virtual std::optional<std::vector<std::int64_t>> output_shape(
      const std::string& name) const = 0;
};

}  // namespace vigil::vision
