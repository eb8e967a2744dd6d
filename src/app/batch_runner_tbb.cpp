#include <vigil/app/batch_runner_tbb.hpp>

#ifdef VIGIL_HAS_TBB

#include <vigil/core/logging.hpp>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace vigil::app {

void run_detection_multi_source_tbb(
    const std::unordered_map<std::string, const vigil::vision::ObjectDetector*>& detectors,
    const std::vector<std::pair<std::string, vigil::core::Image>>& work_items,
    SourceDetectionsCallback callback) {
  if (work_items.empty() || !callback) return;

  auto log = vigil::core::get_logger("batch");
  const std::size_t n = work_items.size();
  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, n),
      [&](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          const std::string& source_id = work_items[i].first;
          auto it = detectors.find(source_id);
          if (it == detectors.end() || it->second == nullptr) {
            log->warn("No detector for source {}; skipping work item {}", source_id, i);
            continue;
          }
          auto result = it->second->detect(work_items[i].second);
          if (!result) {
            log->warn("Source {} work item {} failed: {}", source_id, i,
                      vigil::core::to_string(result.error()));
            continue;
          }
          callback(source_id, *result);
        }
      });
}

}  // namespace vigil::app

#endif  // VIGIL_HAS_TBB
