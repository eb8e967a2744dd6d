#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace vigil::core {

/// Dense row-major float32 tensor. Owns its values; shape dims are all >= 0.
class Tensor {
 public:
  Tensor() = default;

  /// Zero-filled tensor of the given shape. Throws std::invalid_argument on a negative dim.
  explicit Tensor(std::vector<std::int64_t> shape);

  /// Throws std::invalid_argument if values.size() does not match the shape.
  Tensor(std::vector<std::int64_t> shape, std::vector<float> values);

  [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept {
    return shape_;
  }
  [[nodiscard]] std::size_t rank() const noexcept { return shape_.size(); }

  /// Size of one axis; 0 when axis >= rank().
  [[nodiscard]] std::int64_t dim(std::size_t axis) const noexcept {
    return axis < shape_.size() ? shape_[axis] : 0;
  }

  [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

  [[nodiscard]] std::span<float> data() noexcept {
    return std::span<float>(values_.data(), values_.size());
  }
  [[nodiscard]] std::span<const float> data() const noexcept {
    return std::span<const float>(values_.data(), values_.size());
  }

  /// Element access by full index. Throws std::out_of_range on rank or bounds mismatch.
  [[nodiscard]] float at(std::initializer_list<std::int64_t> index) const;
  [[nodiscard]] float& at(std::initializer_list<std::int64_t> index);

  /// Number of elements for a shape; 0 if any dim is negative (dynamic). An empty shape
  /// is a scalar (one element).
  [[nodiscard]] static std::size_t element_count(
      std::span<const std::int64_t> shape) noexcept;

 private:
  [[nodiscard]] std::size_t offset(std::initializer_list<std::int64_t> index) const;

  std::vector<std::int64_t> shape_;
  std::vector<float> values_;
};

/// Tensors keyed by model tensor name (inference inputs and outputs).
using NamedTensors = std::unordered_map<std::string, Tensor>;

/// "[1,3,416,416]" style rendering for logs.
[[nodiscard]] std::string shape_to_string(std::span<const std::int64_t> shape);

}  // namespace vigil::core
