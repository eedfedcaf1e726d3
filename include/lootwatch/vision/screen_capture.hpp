#pragma once

#include <lootwatch/core/error.hpp>
#include <lootwatch/core/frame.hpp>
#include <lootwatch/core/region.hpp>
#include <expected>

namespace lootwatch::vision {

/// Source of screen bitmaps. capture_region() returns the pixels of the given
/// (normalized) rectangle, or CaptureFailed when the region is off-screen or no
/// display is available. Called from the scheduler's worker thread only.
class IScreenCapture {
 public:
  virtual ~IScreenCapture() = default;

  [[nodiscard]] virtual std::expected<lootwatch::core::Frame, lootwatch::core::LootError>
  capture_region(const lootwatch::core::Region& region) = 0;
};

}  // namespace lootwatch::vision
