#pragma once

#include <vigil/core/detection.hpp>
#include <vector>

namespace vigil::core {

/// Per-label non-maximum suppression.
///
/// Detections are grouped by label; within a group the highest-confidence box is kept
/// and every remaining box whose IoU with it is strictly greater than iou_threshold is
/// dropped, repeatedly. Boxes of different labels never suppress each other.
/// Output is grouped by label in first-seen order, each group confidence-descending
/// (equal confidences keep input order).
[[nodiscard]] std::vector<DetectionResult> non_max_suppression(
    std::vector<DetectionResult> detections,
    float iou_threshold);

/// Same as above for decoder candidates.
[[nodiscard]] std::vector<DetectionResult> non_max_suppression(
    const std::vector<CandidateDetection>& candidates,
    float iou_threshold);

}  // namespace vigil::core
