#include <vigil/core/model_config.hpp>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

namespace vigil::core {

namespace {

std::string lookup(const std::map<std::string, std::string>& m, const std::string& key) {
  const auto it = m.find(key);
  return it == m.end() ? std::string{} : it->second;
}

/// Numeric layer index of "boxes_N"; a bare key is layer 0, a non-numeric suffix sorts last.
std::uint64_t layer_index(std::string_view suffix) {
  if (suffix.empty()) return 0;
  std::uint64_t n = 0;
  const auto [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), n);
  if (ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return n;
}

/// Tensor names for "key" and "key_N" entries, in layer order (boxes_2 before boxes_10).
std::vector<std::string> names_for(const std::map<std::string, std::string>& m,
                                   std::string_view key) {
  const std::string prefix = std::string(key) + "_";
  std::vector<std::pair<std::uint64_t, const std::map<std::string, std::string>::value_type*>>
      found;
  for (const auto& entry : m) {
    const std::string& k = entry.first;
    if (k == key) {
      found.emplace_back(0, &entry);
    } else if (k.starts_with(prefix)) {
      found.emplace_back(layer_index(std::string_view(k).substr(prefix.size())), &entry);
    }
  }
  std::stable_sort(found.begin(), found.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<std::string> out;
  out.reserve(found.size());
  for (const auto& [index, entry] : found) {
    out.push_back(entry->second);
  }
  return out;
}

bool in_unit_range(float v) { return v >= 0.f && v <= 1.f; }

}  // namespace

std::string ModelConfig::image_input_name() const {
  return lookup(input_tensors, "image");
}

std::string ModelConfig::shape_input_name() const {
  return lookup(input_tensors, "shape");
}

std::vector<std::string> ModelConfig::boxes_output_names() const {
  return names_for(output_tensors, "boxes");
}

std::vector<std::string> ModelConfig::scores_output_names() const {
  return names_for(output_tensors, "scores");
}

ModelConfig tiny_yolov3_defaults() {
  ModelConfig c;
  c.kind = ModelKind::TinyYoloV3;
  c.image_size = 416;
  c.confidence_threshold = 0.25f;
  c.iou_threshold = 0.45f;
  c.input_tensors = {{"image", "input_1"}, {"shape", "image_shape"}};
  c.output_tensors = {{"boxes", "yolonms_layer_1"}, {"scores", "yolonms_layer_1:1"}};
  return c;
}

ModelConfig yolov4_defaults() {
  ModelConfig c;
  c.kind = ModelKind::YoloV4;
  c.image_size = 416;
  c.confidence_threshold = 0.25f;
  c.iou_threshold = 0.45f;
  c.input_tensors = {{"image", "input_1:0"}};
  c.output_tensors = {
      {"boxes_1", "boxes_1"},   {"boxes_2", "boxes_2"},   {"boxes_3", "boxes_3"},
      {"scores_1", "scores_1"}, {"scores_2", "scores_2"}, {"scores_3", "scores_3"},
  };
  c.anchors = {12, 16, 19, 36, 40, 28, 36, 75, 76, 55, 72, 146, 142, 110, 192, 243, 459, 401};
  c.strides = {8, 16, 32};
  c.xyscale = {1.2f, 1.1f, 1.05f};
  return c;
}

std::vector<std::string> validate(const ModelConfig& config) {
  std::vector<std::string> failures;

  if (config.model_path.empty()) {
    failures.emplace_back("model_path: Model path is required");
  }
  if (config.labels_path.empty()) {
    failures.emplace_back("labels_path: Labels path is required");
  }
  if (config.image_size < 1 || config.image_size > 4096) {
    failures.emplace_back("image_size: Image size must be between 1 and 4096");
  }
  if (!in_unit_range(config.confidence_threshold)) {
    failures.emplace_back("confidence_threshold: Confidence threshold must be between 0 and 1");
  }
  if (!in_unit_range(config.iou_threshold)) {
    failures.emplace_back("iou_threshold: IoU threshold must be between 0 and 1");
  }
  if ((config.display_width == 0) != (config.display_height == 0)) {
    failures.emplace_back("display_width/display_height: Both must be 0 or both positive");
  }
  if (config.image_input_name().empty()) {
    failures.emplace_back("input.image: Input tensor 'image' is required");
  }

  const auto boxes = config.boxes_output_names();
  const auto scores = config.scores_output_names();

  switch (config.kind) {
    case ModelKind::TinyYoloV3:
      if (config.shape_input_name().empty()) {
        failures.emplace_back("input.shape: Input tensor 'shape' is required for Tiny YOLOv3");
      }
      if (config.output_tensors.find("boxes") == config.output_tensors.end()) {
        failures.emplace_back("output.boxes: Output tensor 'boxes' is required for Tiny YOLOv3");
      }
      if (config.output_tensors.find("scores") == config.output_tensors.end()) {
        failures.emplace_back("output.scores: Output tensor 'scores' is required for Tiny YOLOv3");
      }
      break;
    case ModelKind::YoloV4: {
      if (boxes.empty() || boxes.size() != scores.size()) {
        failures.emplace_back(
            "output: YOLOv4 needs one 'boxes_N' and one 'scores_N' output per layer");
      }
      const std::size_t layers = boxes.size();
      if (config.strides.size() != layers) {
        failures.emplace_back("strides: Expected one stride per output layer");
      }
      if (config.xyscale.size() != layers) {
        failures.emplace_back("xyscale: Expected one xyscale per output layer");
      }
      if (layers > 0 &&
          (config.anchors.empty() || config.anchors.size() % (2 * layers) != 0)) {
        failures.emplace_back(
            "anchors: Expected (width, height) pairs, the same count for every layer");
      }
      for (const float s : config.strides) {
        if (s <= 0.f) {
          failures.emplace_back("strides: Strides must be positive");
          break;
        }
      }
      break;
    }
  }
  return failures;
}

const char* model_kind_name(ModelKind kind) noexcept {
  switch (kind) {
    case ModelKind::TinyYoloV3:
      return "tiny_yolov3";
    case ModelKind::YoloV4:
      return "yolov4";
  }
  return "unknown";
}

}  // namespace vigil::core
