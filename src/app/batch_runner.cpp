#include <vigil/app/batch_runner.hpp>
#include <vigil/core/logging.hpp>
#include <vigil/vision/load_image.hpp>
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace vigil::app {

namespace vc = vigil::core;
namespace vv = vigil::vision;

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

bool cancel_requested(const BatchOptions& options) {
  return options.cancel != nullptr && options.cancel->load();
}

/// Outcome slot per frame, filled by whichever worker ran it.
struct FrameSlot {
  bool done{false};
  vc::DetectionError error{vc::DetectionError::None};
  std::vector<vc::DetectionResult> detections;
};

void process_frame(const vv::ObjectDetector& detector,
                   const FrameLoader& loader,
                   std::size_t index,
                   FrameSlot& slot) {
  auto image = loader(index);
  if (!image) {
    slot.error = vc::DetectionError::InvalidImage;
  } else {
    auto result = detector.detect(*image);
    if (result) {
      slot.detections = std::move(*result);
    } else {
      slot.error = result.error();
    }
  }
  slot.done = true;
}

std::expected<BatchResult, BatchFailure> collect(std::vector<FrameSlot>& slots, bool cancelled) {
  BatchResult out;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    if (!slots[i].done) break;
    if (slots[i].error != vc::DetectionError::None) {
      return std::unexpected(BatchFailure{i, slots[i].error});
    }
    out.frames.push_back({i, std::move(slots[i].detections)});
  }
  // A frame finished out of order after an earlier gap still reports its failure.
  for (std::size_t i = out.frames.size(); i < slots.size(); ++i) {
    if (slots[i].done && slots[i].error != vc::DetectionError::None) {
      return std::unexpected(BatchFailure{i, slots[i].error});
    }
  }
  out.cancelled = cancelled && out.frames.size() < slots.size();
  out.objects = summarize_detections(out.frames);
  return out;
}

}  // namespace

std::expected<BatchResult, BatchFailure> run_detection_batch(const vv::ObjectDetector& detector,
                                                             std::size_t frame_count,
                                                             const FrameLoader& loader,
                                                             const BatchOptions& options) {
  auto log = vc::get_logger("batch");
  std::vector<FrameSlot> slots(frame_count);
  if (frame_count == 0) return collect(slots, false);

  const std::size_t workers = std::min(effective_workers(options.num_workers), frame_count);
  log->info("Processing {} frames with {} worker(s)", frame_count, workers);

  std::mutex progress_mutex;
  std::size_t processed = 0;
  auto report = [&]() {
    std::lock_guard lock(progress_mutex);
    ++processed;
    if (options.progress) options.progress(processed, frame_count);
  };

  bool cancelled = false;

  if (workers <= 1) {
    for (std::size_t i = 0; i < frame_count; ++i) {
      if (cancel_requested(options)) {
        cancelled = true;
        break;
      }
      process_frame(detector, loader, i, slots[i]);
      report();
      if (slots[i].error != vc::DetectionError::None) break;
    }
  } else {
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::atomic<bool> stopped_by_cancel{false};

    auto worker = [&]() {
      while (true) {
        if (failed.load()) break;
        if (cancel_requested(options)) {
          stopped_by_cancel = true;
          break;
        }
        const std::size_t idx = next.fetch_add(1);
        if (idx >= frame_count) break;
        process_frame(detector, loader, idx, slots[idx]);
        report();
        if (slots[idx].error != vc::DetectionError::None) failed = true;
      }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& t : threads) {
      t.join();
    }
    cancelled = stopped_by_cancel.load() && !failed.load();
  }

  auto result = collect(slots, cancelled);
  if (!result) {
    log->error("Frame {} failed: {}", result.error().frame_index,
               vc::to_string(result.error().error));
  } else if (result->cancelled) {
    log->warn("Batch cancelled after {} of {} frames", result->frames.size(), frame_count);
  }
  return result;
}

std::expected<BatchResult, BatchFailure> run_detection_batch(const vv::ObjectDetector& detector,
                                                             std::span<const vc::Image> images,
                                                             const BatchOptions& options) {
  const FrameLoader loader = [images](std::size_t i) -> std::optional<vc::Image> {
    return images[i];
  };
  return run_detection_batch(detector, images.size(), loader, options);
}

std::expected<BatchResult, BatchFailure> run_detection_batch(
    const vv::ObjectDetector& detector,
    std::span<const std::string> image_paths,
    const BatchOptions& options) {
  const FrameLoader loader = [image_paths](std::size_t i) {
    auto image = vv::load_image(image_paths[i]);
    if (!image) {
      vc::get_logger("batch")->error("Failed to load image: {}", image_paths[i]);
    }
    return image;
  };
  return run_detection_batch(detector, image_paths.size(), loader, options);
}

std::vector<ObjectSummary> summarize_detections(std::span<const FrameDetections> frames) {
  std::vector<ObjectSummary> out;
  std::vector<double> confidence_sums;
  std::map<std::string, std::size_t> slot_of;
  for (const auto& frame : frames) {
    for (const auto& d : frame.detections) {
      auto [it, inserted] = slot_of.try_emplace(d.label, out.size());
      if (inserted) {
        out.push_back({d.label, 0, 0.f});
        confidence_sums.push_back(0.0);
      }
      ++out[it->second].count;
      confidence_sums[it->second] += d.confidence;
    }
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i].average_confidence =
        static_cast<float>(confidence_sums[i] / static_cast<double>(out[i].count));
  }
  return out;
}

}  // namespace vigil::app
