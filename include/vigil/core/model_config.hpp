#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace vigil::core {

/// Supported detector architectures; each has its own decoding strategy.
enum class ModelKind : std::uint8_t {
  TinyYoloV3,  // single NMS-layer output, direct box regression
  YoloV4,      // three anchor-based grid outputs
};

/// Axis order of a YOLOv4 per-layer scores tensor.
enum class TensorLayout : std::uint8_t {
  ClassFirst,  // [1, C, H, W, A]
  ClassLast,   // [1, H, W, A, C]
};

/// Static model configuration. Loaded once at startup and shared read-only afterwards.
struct ModelConfig {
  ModelKind kind{ModelKind::TinyYoloV3};
  std::string model_path;
  std::string labels_path;
  std::uint32_t image_size{416};
  float confidence_threshold{0.25f};
  float iou_threshold{0.45f};

  /// Logical key ("image", "shape") -> model input tensor name.
  std::map<std::string, std::string> input_tensors;
  /// Logical key ("boxes", "scores", or "boxes_1".."boxes_N", "scores_1".."scores_N")
  /// -> model output tensor name. Layer order follows key order.
  std::map<std::string, std::string> output_tensors;

  /// YOLOv4 only: (width, height) pairs, anchors-per-layer pairs for each layer in order.
  std::vector<float> anchors;
  std::vector<float> strides;
  std::vector<float> xyscale;
  /// YOLOv4 only: explicit scores layout; nullopt = resolve from model metadata at load.
  std::optional<TensorLayout> score_layout;

  /// Coordinate space of DetectionResult boxes. 0 x 0 = original image pixels.
  std::uint32_t display_width{0};
  std::uint32_t display_height{0};

  [[nodiscard]] std::string image_input_name() const;
  /// Empty if no "shape" input is bound.
  [[nodiscard]] std::string shape_input_name() const;
  /// Output tensor names bound to keys "boxes" / "boxes_*", in key order.
  [[nodiscard]] std::vector<std::string> boxes_output_names() const;
  /// Output tensor names bound to keys "scores" / "scores_*", in key order.
  [[nodiscard]] std::vector<std::string> scores_output_names() const;
};

/// Defaults for the ONNX model zoo Tiny YOLOv3 export (416 input, NMS layer outputs).
[[nodiscard]] ModelConfig tiny_yolov3_defaults();

/// Defaults for YOLOv4 (416 input, three layers, standard anchors/strides/xyscale).
[[nodiscard]] ModelConfig yolov4_defaults();

/// All configuration failures, one message per problem. Empty when valid.
[[nodiscard]] std::vector<std::string> validate(const ModelConfig& config);

[[nodiscard]] const char* model_kind_name(ModelKind kind) noexcept;

}  // namespace vigil::core
