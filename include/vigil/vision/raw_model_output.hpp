#pragma once

#include <vigil/core/tensor.hpp>
#include <vector>

namespace vigil::vision {

/// One detection layer's raw outputs; shapes are fixed per model variant.
struct LayerOutput {
  vigil::core::Tensor boxes;
  vigil::core::Tensor scores;
};

/// Raw model output (boxes and class scores per layer) before decoding to candidates.
/// Tiny YOLOv3 has one layer; YOLOv4 has one per stride.
struct RawModelOutput {
  std::vector<LayerOutput> layers;
};

}  // namespace vigil::vision
