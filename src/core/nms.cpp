#include <vigil/core/nms.hpp>
#include <vigil/core/geometry.hpp>
#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>

namespace vigil::core {

std::vector<DetectionResult> non_max_suppression(
    std::vector<DetectionResult> detections,
    float iou_threshold) {
  std::vector<std::vector<DetectionResult>> groups;
  std::unordered_map<std::string, std::size_t> group_index;
  for (auto& d : detections) {
    auto [it, inserted] = group_index.try_emplace(d.label, groups.size());
    if (inserted) {
      groups.emplace_back();
    }
    groups[it->second].push_back(std::move(d));
  }

  std::vector<DetectionResult> kept;
  kept.reserve(detections.size());
  for (auto& group : groups) {
    std::stable_sort(group.begin(), group.end(),
                     [](const DetectionResult& a, const DetectionResult& b) {
                       return a.confidence > b.confidence;
                     });

    // group is confidence-descending, so the first not-yet-removed entry is always
    // the best remaining one.
    std::vector<bool> removed(group.size(), false);
    for (std::size_t i = 0; i < group.size(); ++i) {
      if (removed[i]) continue;
      for (std::size_t j = i + 1; j < group.size(); ++j) {
        if (!removed[j] &&
            intersection_over_union(group[i].bounding_box, group[j].bounding_box) >
                iou_threshold) {
          removed[j] = true;
        }
      }
      kept.push_back(std::move(group[i]));
    }
  }
  return kept;
}

std::vector<DetectionResult> non_max_suppression(
    const std::vector<CandidateDetection>& candidates,
    float iou_threshold) {
  std::vector<DetectionResult> detections;
  detections.reserve(candidates.size());
  for (const auto& c : candidates) {
    detections.push_back(c.to_result());
  }
  return non_max_suppression(std::move(detections), iou_threshold);
}

}  // namespace vigil::core
