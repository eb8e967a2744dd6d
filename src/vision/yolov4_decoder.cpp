#include <vigil/vision/yolov4_decoder.hpp>
#include <vigil/core/geometry.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/tensor.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace vigil::vision {

namespace vc = vigil::core;

namespace {

float sigmoid(float x) { return 1.f / (1.f + std::exp(-x)); }

/// Grid geometry shared by one layer's boxes and scores.
struct LayerGrid {
  std::size_t height{0};
  std::size_t width{0};
  std::size_t anchors{0};
  std::size_t box_channels{0};
  std::size_t classes{0};
};

std::optional<LayerGrid> layer_grid(const LayerOutput& layer, vc::TensorLayout layout) {
  const vc::Tensor& boxes = layer.boxes;
  const vc::Tensor& scores = layer.scores;
  if (boxes.rank() != 5 || boxes.dim(0) != 1 || boxes.dim(4) < 4) return std::nullopt;
  if (scores.rank() != 5 || scores.dim(0) != 1) return std::nullopt;

  LayerGrid g;
  g.height = static_cast<std::size_t>(boxes.dim(1));
  g.width = static_cast<std::size_t>(boxes.dim(2));
  g.anchors = static_cast<std::size_t>(boxes.dim(3));
  g.box_channels = static_cast<std::size_t>(boxes.dim(4));

  std::int64_t h = 0, w = 0, a = 0;
  if (layout == vc::TensorLayout::ClassLast) {
    h = scores.dim(1);
    w = scores.dim(2);
    a = scores.dim(3);
    g.classes = static_cast<std::size_t>(scores.dim(4));
  } else {
    g.classes = static_cast<std::size_t>(scores.dim(1));
    h = scores.dim(2);
    w = scores.dim(3);
    a = scores.dim(4);
  }
  if (static_cast<std::size_t>(h) != g.height || static_cast<std::size_t>(w) != g.width ||
      static_cast<std::size_t>(a) != g.anchors) {
    return std::nullopt;
  }
  return g;
}

}  // namespace

std::optional<vc::TensorLayout> detect_score_layout(std::span<const std::int64_t> shape,
                                                    std::size_t num_classes) noexcept {
  if (shape.size() != 5) return std::nullopt;
  const auto classes = static_cast<std::int64_t>(num_classes);
  const std::int64_t d1 = shape[1];
  const std::int64_t d4 = shape[4];

  if (d4 == classes && d1 != classes) return vc::TensorLayout::ClassLast;
  if (d1 == classes && d4 != classes) return vc::TensorLayout::ClassFirst;
  if (d1 <= 0 && d4 <= 0) return std::nullopt;
  return d1 > d4 ? vc::TensorLayout::ClassFirst : vc::TensorLayout::ClassLast;
}

YoloV4Decoder::YoloV4Decoder(std::shared_ptr<const vc::ModelConfig> config,
                             std::shared_ptr<const LabelList> labels,
                             vc::TensorLayout score_layout)
    : config_(std::move(config)),
      labels_(std::move(labels)),
      score_layout_(score_layout),
      anchors_per_layer_(config_->strides.empty()
                             ? 0
                             : config_->anchors.size() / (2 * config_->strides.size())),
      log_(vc::get_logger("yolov4")) {}

std::expected<std::vector<vc::CandidateDetection>, vc::DetectionError>
YoloV4Decoder::decode(const RawModelOutput& output,
                      std::uint32_t original_width,
                      std::uint32_t original_height) const {
  const auto& log = log_;
  const vc::ModelConfig& cfg = *config_;

  if (output.layers.size() != cfg.strides.size() || output.layers.size() != cfg.xyscale.size()) {
    log->error("Expected {} output layers, got {}", cfg.strides.size(), output.layers.size());
    return std::unexpected(vc::DetectionError::Decoding);
  }

  const vc::LetterboxTransform letterbox =
      vc::compute_letterbox(original_width, original_height, cfg.image_size);
  const vc::ScaleFactors display = vc::target_scale(
      cfg.display_width, cfg.display_height, original_width, original_height);
  const auto max_x = static_cast<float>(original_width);
  const auto max_y = static_cast<float>(original_height);

  std::vector<vc::CandidateDetection> candidates;
  for (std::size_t l = 0; l < output.layers.size(); ++l) {
    const LayerOutput& layer = output.layers[l];
    log->debug("Processing layer {} - boxes shape: {}, scores shape: {}", l,
               vc::shape_to_string(layer.boxes.shape()),
               vc::shape_to_string(layer.scores.shape()));

    const auto grid = layer_grid(layer, score_layout_);
    if (!grid || grid->anchors != anchors_per_layer_) {
      log->error("Unexpected tensor format in layer {}: boxes {}, scores {}", l,
                 vc::shape_to_string(layer.boxes.shape()),
                 vc::shape_to_string(layer.scores.shape()));
      return std::unexpected(vc::DetectionError::Decoding);
    }
    if (grid->classes > labels_->size()) {
      log->error("Layer {} scores {} classes but only {} labels are loaded", l, grid->classes,
                 labels_->size());
      return std::unexpected(vc::DetectionError::Decoding);
    }

    const float stride = cfg.strides[l];
    const float xyscale = cfg.xyscale[l];
    const float* layer_anchors = cfg.anchors.data() + l * anchors_per_layer_ * 2;
    const float* box_data = layer.boxes.data().data();
    const float* score_data = layer.scores.data().data();
    const std::size_t cells = grid->height * grid->width * grid->anchors;

    for (std::size_t gy = 0; gy < grid->height; ++gy) {
      for (std::size_t gx = 0; gx < grid->width; ++gx) {
        for (std::size_t a = 0; a < grid->anchors; ++a) {
          const std::size_t cell = (gy * grid->width + gx) * grid->anchors + a;

          float best_score = std::numeric_limits<float>::lowest();
          std::size_t best_class = grid->classes;
          for (std::size_t c = 0; c < grid->classes; ++c) {
            const float score = score_layout_ == vc::TensorLayout::ClassLast
                                    ? score_data[cell * grid->classes + c]
                                    : score_data[c * cells + cell];
            if (score > best_score) {
              best_score = score;
              best_class = c;
            }
          }
          if (best_class == grid->classes || best_score < cfg.confidence_threshold) {
            continue;
          }

          const float* raw = box_data + cell * grid->box_channels;
          const float x =
              (sigmoid(raw[0]) * xyscale - 0.5f * (xyscale - 1.f) + static_cast<float>(gx)) *
              stride;
          const float y =
              (sigmoid(raw[1]) * xyscale - 0.5f * (xyscale - 1.f) + static_cast<float>(gy)) *
              stride;
          const float w = std::exp(raw[2]) * layer_anchors[a * 2];
          const float h = std::exp(raw[3]) * layer_anchors[a * 2 + 1];

          const float xmin = std::max(0.f, letterbox.to_original_x(x - w / 2.f));
          const float ymin = std::max(0.f, letterbox.to_original_y(y - h / 2.f));
          const float xmax = std::min(max_x, letterbox.to_original_x(x + w / 2.f));
          const float ymax = std::min(max_y, letterbox.to_original_y(y + h / 2.f));
          if (!(xmin < xmax) || !(ymin < ymax)) {
            continue;
          }

          vc::CandidateDetection d;
          d.class_id = best_class;
          d.label = (*labels_)[best_class];
          d.confidence = best_score;
          d.box = {xmin * display.x, ymin * display.y, (xmax - xmin) * display.x,
                   (ymax - ymin) * display.y};

          log->debug("Found class {} ({}) with confidence {:.3f}", best_class, d.label,
                     best_score);
          candidates.push_back(std::move(d));
        }
      }
    }
  }
  return candidates;
}

}  // namespace vigil::vision
