#include <vigil/vision/labels.hpp>
#include <fstream>
#include <stdexcept>

namespace vigil::vision {

LabelList load_labels(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Labels file not found at " + path);
  }

  LabelList labels;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    labels.push_back(line);
  }
  if (labels.empty()) {
    throw std::runtime_error("Labels file " + path + " contains no labels");
  }
  return labels;
}

}  // namespace vigil::vision
