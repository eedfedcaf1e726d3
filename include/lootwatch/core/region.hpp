#pragma once

#include <lootwatch/core/error.hpp>
#include <expected>

namespace lootwatch::core {

inline constexpr int kMinRegionWidth = 300;
inline constexpr int kMinRegionHeight = 100;

/// Screen rectangle in pixels. Width/height may be negative when the
/// selection was dragged right-to-left or bottom-to-top; normalize before use.
struct Region {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  friend bool operator==(const Region&, const Region&) = default;
};

/// Flips negative extents into positive ones (moving the origin accordingly),
/// clamps the origin to non-negative coordinates and enforces the minimum size.
/// Returns InvalidRegion when the rectangle is smaller than
/// kMinRegionWidth x kMinRegionHeight.
[[nodiscard]] std::expected<Region, LootError> normalize_region(const Region& region);

}  // namespace lootwatch::core
