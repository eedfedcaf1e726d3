#pragma once

#include <lootwatch/core/error.hpp>
#include <lootwatch/core/frame.hpp>
#include <lootwatch/core/ocr_reading.hpp>
#include <expected>
#include <string_view>
#include <vector>

namespace lootwatch::vision {

/// Text recognition over one captured frame.
/// Implement recognize(); optionally override validate_input and warmup.
class IOcrEngine {
 public:
  virtual ~IOcrEngine() = default;

  /// Zero or more fragments with confidence (0..1) and a bounding polygon in
  /// frame coordinates. Timestamps are left for the caller to assign.
  [[nodiscard]] virtual std::expected<std::vector<lootwatch::core::OcrReading>,
                                      lootwatch::core::LootError>
  recognize(const lootwatch::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before recognize. Default: accept non-empty.
  [[nodiscard]] virtual std::expected<void, lootwatch::core::LootError>
  validate_input(const lootwatch::core::Frame& input) const {
    if (input.empty()) {
      return std::unexpected(lootwatch::core::LootError::InvalidFrame);
    }
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace lootwatch::vision
