#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/image.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/vision/detection_model.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <vector>

namespace vigil::vision {

/// Steps of one detect() call, in order.
enum class DetectionStage : std::uint8_t {
  Preprocess,
  Inference,
  Decode,
  Suppress,
};

/// Callback for per-stage timing: (stage, duration_ms). Optional; pass to detect().
using StageTimingCallback = std::function<void(DetectionStage stage, double duration_ms)>;

/// Runs preprocess -> inference -> decode -> non-max suppression for one image.
///
/// Either the full (possibly empty) detection list is returned or the call fails; there is
/// no partial result and no retry. Failures are logged before they are returned.
/// Thread-safe: detect() may be called from several threads concurrently (the model is
/// only read).
class ObjectDetector {
 public:
  ObjectDetector(std::unique_ptr<IDetectionModel> model, float iou_threshold);

  [[nodiscard]] std::expected<std::vector<vigil::core::DetectionResult>,
                              vigil::core::DetectionError>
  detect(const vigil::core::Image& image, StageTimingCallback* timing_cb = nullptr) const;

  /// Decode encoded image bytes first; undecodable bytes fail with InvalidImage.
  [[nodiscard]] std::expected<std::vector<vigil::core::DetectionResult>,
                              vigil::core::DetectionError>
  detect_encoded(std::span<const std::byte> encoded,
                 StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] const IDetectionModel& model() const noexcept { return *model_; }
  [[nodiscard]] float iou_threshold() const noexcept { return iou_threshold_; }

 private:
  std::unique_ptr<IDetectionModel> model_;
  float iou_threshold_;
  std::shared_ptr<spdlog::logger> log_;
};

}  // namespace vigil::vision
