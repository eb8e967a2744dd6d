#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/image.hpp>
#include <vigil/vision/object_detector.hpp>
#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace vigil::app {

/// Progress after each finished frame: (processed, total). Invoked under a lock, in
/// completion order; may be called from worker threads.
using ProgressCallback = std::function<void(std::size_t processed, std::size_t total)>;

/// Produces the image for frame \p index; nullopt means it could not be loaded.
using FrameLoader = std::function<std::optional<vigil::core::Image>(std::size_t index)>;

struct BatchOptions {
  /// 1 = sequential on the calling thread; 0 = hardware concurrency.
  std::size_t num_workers{1};
  /// Checked before each frame starts; frames already running finish.
  const std::atomic<bool>* cancel{nullptr};
  ProgressCallback progress;
};

struct FrameDetections {
  std::size_t frame_index{0};
  std::vector<vigil::core::DetectionResult> detections;
};

/// Per-label totals over a batch.
struct ObjectSummary {
  std::string label;
  std::size_t count{0};
  float average_confidence{0.f};
};

struct BatchResult {
  /// Completed frames in frame order (a prefix of the input when cancelled).
  std::vector<FrameDetections> frames;
  /// One entry per label, in first-seen order.
  std::vector<ObjectSummary> objects;
  bool cancelled{false};
};

/// First failing frame (lowest index) and its error. The batch stops at the first failure.
struct BatchFailure {
  std::size_t frame_index{0};
  vigil::core::DetectionError error{vigil::core::DetectionError::None};
};

/// Run \p detector over \p frame_count frames obtained from \p loader.
[[nodiscard]] std::expected<BatchResult, BatchFailure> run_detection_batch(
    const vigil::vision::ObjectDetector& detector,
    std::size_t frame_count,
    const FrameLoader& loader,
    const BatchOptions& options = {});

[[nodiscard]] std::expected<BatchResult, BatchFailure> run_detection_batch(
    const vigil::vision::ObjectDetector& detector,
    std::span<const vigil::core::Image> images,
    const BatchOptions& options = {});

/// Image files; a file that cannot be read fails the batch with InvalidImage.
[[nodiscard]] std::expected<BatchResult, BatchFailure> run_detection_batch(
    const vigil::vision::ObjectDetector& detector,
    std::span<const std::string> image_paths,
    const BatchOptions& options = {});

/// Count and average confidence per label over all frames, in first-seen order.
[[nodiscard]] std::vector<ObjectSummary> summarize_detections(
    std::span<const FrameDetections> frames);

}  // namespace vigil::app
