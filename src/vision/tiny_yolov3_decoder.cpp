#include <vigil/vision/tiny_yolov3_decoder.hpp>
#include <vigil/core/geometry.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/tensor.hpp>
#include <cstddef>
#include <limits>

namespace vigil::vision {

namespace vc = vigil::core;

TinyYoloV3Decoder::TinyYoloV3Decoder(std::shared_ptr<const vc::ModelConfig> config,
                                     std::shared_ptr<const LabelList> labels)
    : config_(std::move(config)),
      labels_(std::move(labels)),
      log_(vc::get_logger("tiny_yolov3")) {}

std::expected<std::vector<vc::CandidateDetection>, vc::DetectionError>
TinyYoloV3Decoder::decode(const RawModelOutput& output,
                          std::uint32_t original_width,
                          std::uint32_t original_height) const {
  const auto& log = log_;

  if (output.layers.size() != 1) {
    log->error("Expected 1 output layer, got {}", output.layers.size());
    return std::unexpected(vc::DetectionError::Decoding);
  }
  const vc::Tensor& boxes = output.layers[0].boxes;
  const vc::Tensor& scores = output.layers[0].scores;
  log->debug("Boxes shape: {}", vc::shape_to_string(boxes.shape()));
  log->debug("Scores shape: {}", vc::shape_to_string(scores.shape()));

  const bool boxes_ok = boxes.rank() == 3 && boxes.dim(0) == 1 && boxes.dim(2) == 4;
  const bool scores_ok = scores.rank() == 3 && scores.dim(0) == 1 &&
                         scores.dim(2) == boxes.dim(1);
  if (!boxes_ok || !scores_ok) {
    log->error("Unexpected output shapes: boxes {}, scores {} (expected [1,N,4], [1,C,N])",
               vc::shape_to_string(boxes.shape()), vc::shape_to_string(scores.shape()));
    return std::unexpected(vc::DetectionError::Decoding);
  }

  const auto num_boxes = static_cast<std::size_t>(boxes.dim(1));
  const auto num_classes = static_cast<std::size_t>(scores.dim(1));
  if (num_classes > labels_->size()) {
    log->error("Model scores {} classes but only {} labels are loaded", num_classes,
               labels_->size());
    return std::unexpected(vc::DetectionError::Decoding);
  }

  const vc::ScaleFactors scale = vc::target_scale(
      config_->display_width, config_->display_height, original_width, original_height);
  const float* box_data = boxes.data().data();
  const float* score_data = scores.data().data();

  std::vector<vc::CandidateDetection> candidates;
  for (std::size_t i = 0; i < num_boxes; ++i) {
    float max_score = std::numeric_limits<float>::lowest();
    std::size_t best_class = num_classes;
    for (std::size_t c = 0; c < num_classes; ++c) {
      const float score = score_data[c * num_boxes + i];
      if (score > max_score) {
        max_score = score;
        best_class = c;
      }
    }
    if (best_class == num_classes || max_score < config_->confidence_threshold) {
      continue;
    }

    const float* b = box_data + i * 4;
    const float y1 = b[0];
    const float x1 = b[1];
    const float y2 = b[2];
    const float x2 = b[3];

    vc::CandidateDetection d;
    d.class_id = best_class;
    d.label = (*labels_)[best_class];
    d.confidence = max_score;
    d.box = {x1 * scale.x, y1 * scale.y, (x2 - x1) * scale.x, (y2 - y1) * scale.y};

    log->debug("Found detection {}: class={} ({}) score={:.3f}", i, best_class, d.label,
               max_score);
    candidates.push_back(std::move(d));
  }
  return candidates;
}

}  // namespace vigil::vision
