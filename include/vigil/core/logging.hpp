#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>

namespace vigil::core {

/// Named component logger ("vigil.<component>"), cloned from the spdlog default
/// logger on first use and registered so later calls return the same instance.
/// Thread-safe.
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(std::string_view component);

/// Apply a level ("trace", "debug", "info", "warn", "error", "critical", "off")
/// to the default logger and every registered logger. Unknown names map to "info".
void set_log_level(std::string_view level);

}  // namespace vigil::core
