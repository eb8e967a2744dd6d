#pragma once

#include <vigil/core/tensor.hpp>
#include <vigil/vision/inference_backend.hpp>
#include <vigil/vision/raw_model_output.hpp>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vigil::vision::detail {

/// Throws std::runtime_error naming the first configured tensor the backend does not declare.
/// A backend that declares no names is not checked.
void require_declared(std::span<const std::string> declared,
                      std::span<const std::string> configured,
                      std::string_view what);

/// Pair up boxes/scores outputs by position into layers.
/// DetectionError::Inference if an expected output is missing from the run result.
[[nodiscard]] std::expected<RawModelOutput, vigil::core::DetectionError> collect_layers(
    vigil::core::NamedTensors& outputs,
    std::span<const std::string> boxes_names,
    std::span<const std::string> scores_names,
    std::string_view model_name);

}  // namespace vigil::vision::detail
