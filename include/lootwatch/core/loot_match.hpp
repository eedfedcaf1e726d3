#pragma once

#include <lootwatch/core/ocr_reading.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lootwatch::core {

enum class MatchMethod : std::uint8_t {
  Exact,
  Fuzzy,
};

[[nodiscard]] constexpr std::string_view to_string(MatchMethod method) noexcept {
  return method == MatchMethod::Exact ? "EXACT" : "FUZZY";
}

/// A recognized fragment resolved to one catalog item.
struct LootMatch {
  std::string item;  // canonical catalog name
  std::uint32_t quantity{1};
  float confidence{0.f};
  MatchMethod method{MatchMethod::Exact};
  std::string original_text;
  Quad bbox{};
  std::optional<std::uint64_t> item_id;
};

}  // namespace lootwatch::core
