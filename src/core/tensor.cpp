#include <vigil/core/tensor.hpp>
#include <sstream>
#include <stdexcept>

namespace vigil::core {

namespace {

void check_shape(const std::vector<std::int64_t>& shape) {
  for (const auto d : shape) {
    if (d < 0) {
      throw std::invalid_argument("Tensor: negative dimension in shape " +
                                  shape_to_string(shape));
    }
  }
}

}  // namespace

Tensor::Tensor(std::vector<std::int64_t> shape) : shape_(std::move(shape)) {
  check_shape(shape_);
  values_.assign(element_count(shape_), 0.f);
}

Tensor::Tensor(std::vector<std::int64_t> shape, std::vector<float> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
  check_shape(shape_);
  if (values_.size() != element_count(shape_)) {
    throw std::invalid_argument("Tensor: " + std::to_string(values_.size()) +
                                " values do not fill shape " + shape_to_string(shape_));
  }
}

std::size_t Tensor::element_count(std::span<const std::int64_t> shape) noexcept {
  std::size_t n = 1;
  for (const auto d : shape) {
    if (d < 0) return 0;
    n *= static_cast<std::size_t>(d);
  }
  return n;
}

std::size_t Tensor::offset(std::initializer_list<std::int64_t> index) const {
  if (index.size() != shape_.size()) {
    throw std::out_of_range("Tensor: index rank " + std::to_string(index.size()) +
                            " does not match tensor rank " + std::to_string(shape_.size()));
  }
  std::size_t off = 0;
  std::size_t axis = 0;
  for (const auto i : index) {
    if (i < 0 || i >= shape_[axis]) {
      throw std::out_of_range("Tensor: index out of bounds for shape " +
                              shape_to_string(shape_));
    }
    off = off * static_cast<std::size_t>(shape_[axis]) + static_cast<std::size_t>(i);
    ++axis;
  }
  return off;
}

float Tensor::at(std::initializer_list<std::int64_t> index) const {
  return values_[offset(index)];
}

float& Tensor::at(std::initializer_list<std::int64_t> index) {
  return values_[offset(index)];
}

std::string shape_to_string(std::span<const std::int64_t> shape) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) out << ',';
    out << shape[i];
  }
  out << ']';
  return out.str();
}

}  // namespace vigil::core
