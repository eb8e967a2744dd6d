#include <vigil/core/logging.hpp>
#include <mutex>

namespace vigil::core {

std::shared_ptr<spdlog::logger> get_logger(std::string_view component) {
  static std::mutex registry_mutex;
  const std::string name = "vigil." + std::string(component);

  std::lock_guard lock(registry_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto logger = spdlog::default_logger()->clone(name);
  spdlog::register_logger(logger);
  return logger;
}

void set_log_level(std::string_view level) {
  auto parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

}  // namespace vigil::core
