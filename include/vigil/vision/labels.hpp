#pragma once

#include <string>
#include <vector>

namespace vigil::vision {

/// Class labels; index = class id. Order matches the trained model exactly and is
/// never sorted or deduplicated.
using LabelList = std::vector<std::string>;

/// Read a label file: one label per line, line i (0-based) = class id i.
/// Trailing '\r' is stripped; blank lines keep their position.
/// Throws std::runtime_error if the file cannot be opened or has no labels.
[[nodiscard]] LabelList load_labels(const std::string& path);

}  // namespace vigil::vision
