#pragma once

#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/loot_match.hpp>
#include <lootwatch/core/ocr_reading.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace lootwatch::core {

struct MatcherConfig {
  float fuzzy_ratio{0.8f};             // share of the name that must appear contiguously
  float fuzzy_confidence_scale{0.8f};  // applied to OCR confidence on fuzzy matches
  std::size_t fuzzy_min_name_length{4};
  std::uint32_t max_quantity{999};
};

/// Maps one recognized fragment onto a catalog item.
///
/// Exact: the catalog name must occur in the text as a whole phrase, either
/// verbatim (after normalize_text) or after confusion correction of both sides.
/// Candidates are tried longest name first; the first hit wins.
/// Fuzzy (only when no exact hit): for names of at least fuzzy_min_name_length
/// characters, some ceil(ratio * length) long substring of the name's
/// confusion key must occur in the text's confusion key. Texts longer than
/// twice the name are never fuzzy-matched against it.
class ItemMatcher {
 public:
  explicit ItemMatcher(MatcherConfig config = {});

  [[nodiscard]] std::optional<LootMatch> match(const OcrReading& reading,
                                               const ItemCatalog& catalog) const;

  /// Count attached to a multiplier token ("x5", "5x", "×3", "*2").
  /// nullopt if absent or outside 1..max_quantity.
  [[nodiscard]] std::optional<std::uint32_t> extract_quantity(std::string_view text) const;

  [[nodiscard]] const MatcherConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] bool fuzzy_hit(std::string_view text_key,
                               const MatchCandidate& candidate) const;

  MatcherConfig config_;
};

}  // namespace lootwatch::core
