#pragma once

#include <string_view>

namespace kensa::app {

/// Set the global spdlog level from a name: trace, debug, info, warn, error, critical
/// or off. Returns false (level unchanged) for an unknown name.
bool configure_logging(std::string_view level);

}  // namespace kensa::app
