#include <vigil/app/config.hpp>
#include <cstdint>
#include <fstream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::app {

namespace {

namespace vc = vigil::core;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

float parse_float(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const float v = std::stof(value, &used);
    if (used != value.size()) throw std::invalid_argument(value);
    return v;
  } catch (const std::logic_error&) {
    throw ConfigurationError(key + ": '" + value + "' is not a number");
  }
}

std::uint32_t parse_uint(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const unsigned long v = std::stoul(value, &used);
    if (used != value.size() || value.front() == '-') throw std::invalid_argument(value);
    if (v > std::numeric_limits<std::uint32_t>::max()) throw std::out_of_range(value);
    return static_cast<std::uint32_t>(v);
  } catch (const std::logic_error&) {
    throw ConfigurationError(key + ": '" + value + "' is not a non-negative integer");
  }
}

std::vector<float> parse_float_list(const std::string& key, const std::string& value) {
  std::vector<float> out;
  std::stringstream ss(value);
  std::string item;
  while (std::getline(ss, item, ',')) {
    trim(item);
    if (item.empty()) continue;
    out.push_back(parse_float(key, item));
  }
  return out;
}

vc::ModelKind parse_model_kind(const std::string& value) {
  if (value == "tiny_yolov3") return vc::ModelKind::TinyYoloV3;
  if (value == "yolov4") return vc::ModelKind::YoloV4;
  throw ConfigurationError("model_kind: unknown model '" + value +
                           "' (use tiny_yolov3 or yolov4)");
}

std::optional<vc::TensorLayout> parse_layout(const std::string& value) {
  if (value == "auto") return std::nullopt;
  if (value == "class_first") return vc::TensorLayout::ClassFirst;
  if (value == "class_last") return vc::TensorLayout::ClassLast;
  throw ConfigurationError("score_layout: unknown layout '" + value +
                           "' (use auto, class_first or class_last)");
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.model = vc::tiny_yolov3_defaults();
  c.backend_type = InferenceBackendType::Onnx;
  c.batch_workers = 1;
  c.log_level = "info";
  return c;
}

AppConfig load_config(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw ConfigurationError("Cannot read config file " + path);
  }

  // Collect first so model_kind can pick the defaults regardless of where it appears.
  std::vector<std::pair<std::string, std::string>> entries;
  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    entries.emplace_back(key, value);
  }

  AppConfig c = default_config();
  for (const auto& [k, v] : entries) {
    if (k == "model_kind") {
      c.model = parse_model_kind(v) == vc::ModelKind::YoloV4 ? vc::yolov4_defaults()
                                                             : vc::tiny_yolov3_defaults();
    }
  }

  // Explicit tensor bindings replace the defaults as a whole.
  std::map<std::string, std::string> inputs;
  std::map<std::string, std::string> outputs;

  for (const auto& [k, v] : entries) {
    if (k == "model_kind") continue;
    else if (k == "model_path") c.model.model_path = v;
    else if (k == "labels_path") c.model.labels_path = v;
    else if (k == "image_size") c.model.image_size = parse_uint(k, v);
    else if (k == "confidence_threshold") c.model.confidence_threshold = parse_float(k, v);
    else if (k == "iou_threshold") c.model.iou_threshold = parse_float(k, v);
    else if (k.starts_with("input.")) inputs[k.substr(6)] = v;
    else if (k.starts_with("output.")) outputs[k.substr(7)] = v;
    else if (k == "anchors") c.model.anchors = parse_float_list(k, v);
    else if (k == "strides") c.model.strides = parse_float_list(k, v);
    else if (k == "xyscale") c.model.xyscale = parse_float_list(k, v);
    else if (k == "score_layout") c.model.score_layout = parse_layout(v);
    else if (k == "display_width") c.model.display_width = parse_uint(k, v);
    else if (k == "display_height") c.model.display_height = parse_uint(k, v);
    else if (k == "backend_type") {
      if (v == "onnx") c.backend_type = InferenceBackendType::Onnx;
      else if (v == "mock") c.backend_type = InferenceBackendType::Mock;
      else throw ConfigurationError("backend_type: unknown backend '" + v + "'");
    }
    else if (k == "batch_workers") c.batch_workers = parse_uint(k, v);
    else if (k == "log_level") c.log_level = v;
  }

  if (!inputs.empty()) c.model.input_tensors = std::move(inputs);
  if (!outputs.empty()) c.model.output_tensors = std::move(outputs);
  return c;
}

}  // namespace vigil::app
