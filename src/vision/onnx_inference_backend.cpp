#include <vigil/vision/onnx_inference_backend.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/tensor.hpp>
#include <onnxruntime_cxx_api.h>
#include <cstdint>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil::vision {

namespace vc = vigil::core;

namespace {

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

struct TensorMetadata {
  std::string name;
  std::vector<int64_t> shape;
  ONNXTensorElementDataType element_type{ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED};
};

TensorMetadata ReadMetadata(const std::string& name, const Ort::TypeInfo& type_info) {
  TensorMetadata meta;
  meta.name = name;
  if (type_info.GetONNXType() == ONNX_TYPE_TENSOR) {
    const auto info = type_info.GetTensorTypeAndShapeInfo();
    meta.shape = info.GetShape();
    meta.element_type = info.GetElementType();
  }
  return meta;
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "vigil"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::vector<TensorMetadata> inputs;
  std::vector<TensorMetadata> outputs;

  std::shared_ptr<spdlog::logger> log = vc::get_logger("onnx");

  const TensorMetadata* find_output(const std::string& name) const {
    for (const auto& m : outputs) {
      if (m.name == name) return &m;
    }
    return nullptr;
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(std::string model_path, int intra_op_threads)
    : impl_(std::make_unique<Impl>()) {
  impl_->session_options.SetIntraOpNumThreads(intra_op_threads);
  impl_->session_options.SetGraphOptimizationLevel(
      GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  const size_t num_inputs = impl_->session.GetInputCount();
  if (num_inputs == 0) {
    throw std::runtime_error("OnnxInferenceBackend: no inputs found in the model metadata");
  }
  for (size_t i = 0; i < num_inputs; ++i) {
    const std::string name = impl_->session.GetInputNameAllocated(i, allocator).get();
    impl_->inputs.push_back(ReadMetadata(name, impl_->session.GetInputTypeInfo(i)));
  }

  const size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 0) {
    throw std::runtime_error("OnnxInferenceBackend: no outputs found in the model metadata");
  }
  for (size_t i = 0; i < num_outputs; ++i) {
    const std::string name = impl_->session.GetOutputNameAllocated(i, allocator).get();
    impl_->outputs.push_back(ReadMetadata(name, impl_->session.GetOutputTypeInfo(i)));
  }

  if (impl_->log->should_log(spdlog::level::debug)) {
    for (const auto& m : impl_->inputs) {
      impl_->log->debug("Model input '{}' shape {}", m.name, vc::shape_to_string(m.shape));
    }
    for (const auto& m : impl_->outputs) {
      impl_->log->debug("Model output '{}' shape {}", m.name, vc::shape_to_string(m.shape));
    }
  }
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::expected<vc::NamedTensors, vc::DetectionError>
OnnxInferenceBackend::run(const vc::NamedTensors& inputs,
                          std::span<const std::string> output_names) {
  Ort::MemoryInfo mem_info = CpuMemoryInfo();

  std::vector<const char*> output_names_c;
  output_names_c.reserve(output_names.size());
  for (const auto& name : output_names) {
    output_names_c.push_back(name.c_str());
  }

  std::vector<const char*> input_names_c;
  std::vector<Ort::Value> input_values;
  input_names_c.reserve(inputs.size());
  input_values.reserve(inputs.size());

  std::vector<Ort::Value> outputs;
  try {
    for (const auto& [name, tensor] : inputs) {
      const auto& shape = tensor.shape();
      input_names_c.push_back(name.c_str());
      input_values.push_back(Ort::Value::CreateTensor<float>(
          mem_info, const_cast<float*>(tensor.data().data()), tensor.size(),
          shape.data(), shape.size()));
    }
    outputs = impl_->session.Run(Ort::RunOptions{nullptr},
                                 input_names_c.data(), input_values.data(), input_values.size(),
                                 output_names_c.data(), output_names_c.size());
  } catch (const Ort::Exception& e) {
    impl_->log->error("Error running model inference: {}", e.what());
    return std::unexpected(vc::DetectionError::Inference);
  }

  if (outputs.size() != output_names.size()) {
    impl_->log->error("Model returned {} outputs, {} requested", outputs.size(),
                      output_names.size());
    return std::unexpected(vc::DetectionError::Inference);
  }

  vc::NamedTensors result;
  for (std::size_t i = 0; i < outputs.size(); ++i) {
    Ort::Value& out = outputs[i];
    if (!out.IsTensor()) {
      impl_->log->error("Output '{}' is not a tensor", output_names[i]);
      return std::unexpected(vc::DetectionError::Inference);
    }
    const auto info = out.GetTensorTypeAndShapeInfo();
    if (info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      impl_->log->error("Output '{}' is not float32", output_names[i]);
      return std::unexpected(vc::DetectionError::Inference);
    }
    std::vector<std::int64_t> shape = info.GetShape();
    const float* data = out.GetTensorData<float>();
    std::vector<float> values(data, data + info.GetElementCount());
    try {
      result.emplace(output_names[i], vc::Tensor(std::move(shape), std::move(values)));
    } catch (const std::invalid_argument& e) {
      impl_->log->error("Output '{}' has an unusable shape: {}", output_names[i], e.what());
      return std::unexpected(vc::DetectionError::Inference);
    }
  }
  return result;
}

std::vector<std::string> OnnxInferenceBackend::input_names() const {
  std::vector<std::string> names;
  for (const auto& m : impl_->inputs) names.push_back(m.name);
  return names;
}

std::vector<std::string> OnnxInferenceBackend::output_names() const {
  std::vector<std::string> names;
  for (const auto& m : impl_->outputs) names.push_back(m.name);
  return names;
}

std::optional<std::vector<std::int64_t>> OnnxInferenceBackend::output_shape(
    const std::string& name) const {
  if (const auto* m = impl_->find_output(name); m && !m->shape.empty()) {
    return m->shape;
  }
  return std::nullopt;
}

}  // namespace vigil::vision
