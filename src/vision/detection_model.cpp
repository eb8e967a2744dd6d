#include <vigil/vision/detection_model.hpp>
#include <vigil/core/logging.hpp>
#include <cstddef>
#include <vector>

namespace vigil::vision {

void IDetectionModel::warmup() const {
  constexpr std::uint32_t kSide = 32;
  std::vector<std::byte> buffer(
      vigil::core::Image::min_bytes(kSide, kSide, vigil::core::PixelFormat::RGB8), std::byte{0});
  const vigil::core::Image black(kSide, kSide, vigil::core::PixelFormat::RGB8,
                                 std::move(buffer));

  auto input = preprocess(black);
  if (!input) {
    vigil::core::get_logger("model")->warn("{} warmup: preprocessing failed ({})", name(),
                                           vigil::core::to_string(input.error()));
    return;
  }
  auto output = run_inference(*input);
  if (!output) {
    vigil::core::get_logger("model")->warn("{} warmup: inference failed ({})", name(),
                                           vigil::core::to_string(output.error()));
  }
}

}  // namespace vigil::vision
