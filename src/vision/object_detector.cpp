#include <vigil/vision/object_detector.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/core/nms.hpp>
#include <vigil/vision/load_image.hpp>
#include <chrono>
#include <stdexcept>

namespace vigil::vision {

namespace vc = vigil::core;

namespace {

class StageTimer {
 public:
  StageTimer(StageTimingCallback* cb, DetectionStage stage)
      : cb_(cb), stage_(stage), start_(std::chrono::steady_clock::now()) {}

  ~StageTimer() {
    if (!cb_) return;
    const auto end = std::chrono::steady_clock::now();
    const double ms = 1e-6 * static_cast<double>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count());
    (*cb_)(stage_, ms);
  }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

 private:
  StageTimingCallback* cb_;
  DetectionStage stage_;
  std::chrono::steady_clock::time_point start_;
};

}  // namespace

ObjectDetector::ObjectDetector(std::unique_ptr<IDetectionModel> model, float iou_threshold)
    : model_(std::move(model)),
      iou_threshold_(iou_threshold),
      log_(vc::get_logger("detector")) {
  if (!model_) {
    throw std::invalid_argument("ObjectDetector: model must not be null");
  }
}

std::expected<std::vector<vc::DetectionResult>, vc::DetectionError> ObjectDetector::detect(
    const vc::Image& image,
    StageTimingCallback* timing_cb) const {
  log_->debug("Image height: {}, width: {}, size: {} bytes", image.height(), image.width(),
             image.size_bytes());

  std::expected<PreprocessedInput, vc::DetectionError> input;
  {
    StageTimer timer(timing_cb, DetectionStage::Preprocess);
    input = model_->preprocess(image);
  }
  if (!input) {
    log_->error("Error during object detection: preprocessing failed ({})",
                vc::to_string(input.error()));
    return std::unexpected(input.error());
  }

  std::expected<RawModelOutput, vc::DetectionError> raw;
  {
    StageTimer timer(timing_cb, DetectionStage::Inference);
    raw = model_->run_inference(*input);
  }
  if (!raw) {
    log_->error("Error during object detection: inference failed ({})",
                vc::to_string(raw.error()));
    return std::unexpected(raw.error());
  }

  std::expected<std::vector<vc::CandidateDetection>, vc::DetectionError> candidates;
  {
    StageTimer timer(timing_cb, DetectionStage::Decode);
    candidates = model_->decode_outputs(*raw, input->original_width, input->original_height);
  }
  if (!candidates) {
    log_->error("Error during object detection: decoding failed ({})",
                vc::to_string(candidates.error()));
    return std::unexpected(candidates.error());
  }

  std::vector<vc::DetectionResult> results;
  {
    StageTimer timer(timing_cb, DetectionStage::Suppress);
    results = vc::non_max_suppression(*candidates, iou_threshold_);
  }
  log_->debug("Total detections found: {} ({} candidates)", results.size(),
              candidates->size());
  return results;
}

std::expected<std::vector<vc::DetectionResult>, vc::DetectionError>
ObjectDetector::detect_encoded(std::span<const std::byte> encoded,
                               StageTimingCallback* timing_cb) const {
  auto image = decode_image(encoded);
  if (!image) {
    log_->error(
        "Error during object detection: {} bytes do not decode to an image", encoded.size());
    return std::unexpected(vc::DetectionError::InvalidImage);
  }
  return detect(*image, timing_cb);
}

}  // namespace vigil::vision
