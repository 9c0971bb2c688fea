#include <kensa/app/logging.hpp>
#include <spdlog/spdlog.h>
#include <string>

namespace kensa::app {

bool configure_logging(std::string_view level) {
  const std::string name(level);
  // from_str maps unknown names to off, so "off" itself is checked explicitly.
  const auto parsed = spdlog::level::from_str(name);
  if (parsed == spdlog::level::off && name != "off") {
    return false;
  }
  spdlog::set_level(parsed);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  return true;
}

}  // namespace kensa::app
