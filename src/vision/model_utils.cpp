#include "model_utils.hpp"
#include <vigil/core/logging.hpp>
#include <algorithm>
#include <stdexcept>

namespace vigil::vision::detail {

namespace vc = vigil::core;

void require_declared(std::span<const std::string> declared,
                      std::span<const std::string> configured,
                      std::string_view what) {
  if (declared.empty()) return;
  for (const auto& name : configured) {
    if (std::find(declared.begin(), declared.end(), name) == declared.end()) {
      throw std::runtime_error("Model does not declare " + std::string(what) + " tensor '" +
                               name + "'");
    }
  }
}

std::expected<RawModelOutput, vc::DetectionError> collect_layers(
    vc::NamedTensors& outputs,
    std::span<const std::string> boxes_names,
    std::span<const std::string> scores_names,
    std::string_view model_name) {
  RawModelOutput raw;
  raw.layers.reserve(boxes_names.size());
  for (std::size_t i = 0; i < boxes_names.size() && i < scores_names.size(); ++i) {
    auto boxes = outputs.find(boxes_names[i]);
    auto scores = outputs.find(scores_names[i]);
    if (boxes == outputs.end() || scores == outputs.end()) {
      vc::get_logger(model_name)
          ->error("Inference result is missing output '{}' or '{}'", boxes_names[i],
                  scores_names[i]);
      return std::unexpected(vc::DetectionError::Inference);
    }
    raw.layers.push_back({std::move(boxes->second), std::move(scores->second)});
  }
  return raw;
}

}  // namespace vigil::vision::detail
