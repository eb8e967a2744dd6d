#include <vigil/vision/mock_inference_backend.hpp>
#include <vigil/core/error.hpp>

namespace vigil::vision {

namespace vc = vigil::core;

void MockInferenceBackend::set_outputs(vc::NamedTensors outputs) {
  std::lock_guard lock(mutex_);
  outputs_ = std::move(outputs);
}

void MockInferenceBackend::set_input_names(std::vector<std::string> names) {
  std::lock_guard lock(mutex_);
  input_names_ = std::move(names);
}

void MockInferenceBackend::set_output_shape(const std::string& name,
                                            std::vector<std::int64_t> shape) {
  std::lock_guard lock(mutex_);
  declared_shapes_[name] = std::move(shape);
}

void MockInferenceBackend::set_fail(bool fail) {
  std::lock_guard lock(mutex_);
  fail_ = fail;
}

std::expected<vc::NamedTensors, vc::DetectionError>
MockInferenceBackend::run(const vc::NamedTensors& inputs,
                          std::span<const std::string> output_names) {
  std::lock_guard lock(mutex_);
  last_inputs_ = inputs;
  ++run_count_;
  if (fail_) {
    return std::unexpected(vc::DetectionError::Inference);
  }

  vc::NamedTensors result;
  for (const auto& name : output_names) {
    const auto it = outputs_.find(name);
    if (it == outputs_.end()) {
      return std::unexpected(vc::DetectionError::Inference);
    }
    result.emplace(name, it->second);
  }
  return result;
}

std::vector<std::string> MockInferenceBackend::input_names() const {
  std::lock_guard lock(mutex_);
  return input_names_;
}

std::vector<std::string> MockInferenceBackend::output_names() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> names;
  names.reserve(outputs_.size());
  for (const auto& [name, tensor] : outputs_) {
    names.push_back(name);
  }
  return names;
}

std::optional<std::vector<std::int64_t>> MockInferenceBackend::output_shape(
    const std::string& name) const {
  std::lock_guard lock(mutex_);
  if (const auto it = declared_shapes_.find(name); it != declared_shapes_.end()) {
    return it->second;
  }
  if (const auto it = outputs_.find(name); it != outputs_.end()) {
    return it->second.shape();
  }
  return std::nullopt;
}

vc::NamedTensors MockInferenceBackend::last_inputs() const {
  std::lock_guard lock(mutex_);
  return last_inputs_;
}

std::size_t MockInferenceBackend::run_count() const {
  std::lock_guard lock(mutex_);
  return run_count_;
}

}  // namespace vigil::vision
