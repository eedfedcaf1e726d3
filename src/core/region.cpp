#include <lootwatch/core/region.hpp>
#include <algorithm>
#include <cstdlib>

namespace lootwatch::core {

std::expected<Region, LootError> normalize_region(const Region& region) {
  Region r = region;

  if (r.width < 0) {
    r.x += r.width;
    r.width = -r.width;
  }
  if (r.height < 0) {
    r.y += r.height;
    r.height = -r.height;
  }

  if (r.width < kMinRegionWidth || r.height < kMinRegionHeight) {
    return std::unexpected(LootError::InvalidRegion);
  }

  r.x = std::max(0, r.x);
  r.y = std::max(0, r.y);
  return r;
}

}  // namespace lootwatch::core
