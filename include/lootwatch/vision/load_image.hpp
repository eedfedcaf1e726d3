#pragma once

#include <lootwatch/core/frame.hpp>
#include <optional>
#include <string>

namespace lootwatch::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<lootwatch::core::Frame> load_frame_from_image(const std::string& path);

}  // namespace lootwatch::vision
