#pragma once

#include <vigil/core/detection.hpp>
#include <vigil/core/error.hpp>
#include <vigil/core/image.hpp>
#include <vigil/vision/preprocessor.hpp>
#include <vigil/vision/raw_model_output.hpp>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

namespace vigil::vision {

/// Per-architecture detection strategy: preprocess -> run inference -> decode.
/// Chosen once when the configuration is loaded and held for the process lifetime.
/// All operations are const and keep no per-call state, so one model may serve
/// several threads.
class IDetectionModel {
 public:
  virtual ~IDetectionModel() = default;

  [[nodiscard]] virtual std::expected<PreprocessedInput, vigil::core::DetectionError>
  preprocess(const vigil::core::Image& image) const = 0;

  [[nodiscard]] virtual std::expected<RawModelOutput, vigil::core::DetectionError>
  run_inference(const PreprocessedInput& input) const = 0;

  [[nodiscard]] virtual std::expected<std::vector<vigil::core::CandidateDetection>,
                                      vigil::core::DetectionError>
  decode_outputs(const RawModelOutput& output,
                 std::uint32_t original_width,
                 std::uint32_t original_height) const = 0;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Run one black frame through preprocess and inference. Failures are logged, not thrown.
  virtual void warmup() const;
};

}  // namespace vigil::vision
