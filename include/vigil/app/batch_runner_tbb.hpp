#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/image.hpp>
#include <vigil/vision/object_detector.hpp>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#ifdef VIGIL_HAS_TBB

namespace vigil::app {

/// Callback for each frame that was detected successfully; receives the source id
/// (camera or upload) and the detections. Invoked from TBB worker threads; must be thread-safe.
using SourceDetectionsCallback = std::function<void(
    const std::string& source_id, const std::vector<vigil::core::DetectionResult>& detections)>;

/// Runs detectors on (source_id, image) work items in parallel using TBB.
///
/// \p detectors maps each source id to its detector; the caller keeps ownership. Work items
/// whose source has no detector, and frames that fail detection, are skipped (failures are
/// logged). ObjectDetector::detect is const, so one detector may serve several items at once
/// as long as its inference backend tolerates concurrent runs (ONNX Runtime sessions do).
void run_detection_multi_source_tbb(
    const std::unordered_map<std::string, const vigil::vision::ObjectDetector*>& detectors,
    const std::vector<std::pair<std::string, vigil::core::Image>>& work_items,
    SourceDetectionsCallback callback);

}  // namespace vigil::app

#endif  // VIGIL_HAS_TBB
