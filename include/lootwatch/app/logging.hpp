#pragma once

#include <string_view>

namespace lootwatch::app {

/// Sets the process-wide OpenCV log level from a config name
/// (silent|fatal|error|warning|info|debug|verbose). Returns false and leaves
/// the level unchanged for an unknown name.
bool configure_logging(std::string_view level);

}  // namespace lootwatch::app
