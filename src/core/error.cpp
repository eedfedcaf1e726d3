#include <lootwatch/core/error.hpp>

namespace lootwatch::core {

std::string_view to_string(LootError error) noexcept {
  switch (error) {
    case LootError::InvalidRegion:
      return "InvalidRegion";
    case LootError::AlreadyRunning:
      return "AlreadyRunning";
    case LootError::NotRunning:
      return "NotRunning";
    case LootError::CaptureFailed:
      return "CaptureFailed";
    case LootError::OcrFailed:
      return "OcrFailed";
    case LootError::OcrTimeout:
      return "OcrTimeout";
    case LootError::NoLocation:
      return "NoLocation";
    case LootError::NotActive:
      return "NotActive";
    case LootError::NoCatalog:
      return "NoCatalog";
    case LootError::InvalidConfig:
      return "InvalidConfig";
    case LootError::LoadFailed:
      return "LoadFailed";
    case LootError::InvalidFrame:
      return "InvalidFrame";
  }
  return "Unknown";
}

}  // namespace lootwatch::core
