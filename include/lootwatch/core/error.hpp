#pragma once

#include <string_view>

namespace lootwatch::core {

/// Error codes; used with std::expected for recoverable failures.
enum class LootError {
  InvalidRegion,
  AlreadyRunning,
  NotRunning,
  CaptureFailed,
  OcrFailed,
  OcrTimeout,
  NoLocation,
  NotActive,
  NoCatalog,
  InvalidConfig,
  LoadFailed,
  InvalidFrame,
};

/// Stable name for logs and CLI output (e.g. "InvalidRegion").
[[nodiscard]] std::string_view to_string(LootError error) noexcept;

}  // namespace lootwatch::core
