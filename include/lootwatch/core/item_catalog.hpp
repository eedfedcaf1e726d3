#pragma once

#include <lootwatch/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace lootwatch::core {

struct ItemCatalogEntry {
  std::uint64_t id{0};
  std::string name;
};

/// Precomputed comparison forms of one catalog entry.
struct MatchCandidate {
  std::uint64_t id{0};
  std::string name;       // canonical, as loaded
  std::string lowered;    // normalize_text(name)
  std::string confusion;  // confusion_key(lowered)
};

/// Case-insensitive, immutable set of item names for one location.
///
/// Built once per location load and shared as a CatalogSnapshot; swapping the
/// snapshot replaces the whole catalog, so a match in progress never observes a
/// half-updated table. Duplicate names (ignoring case) keep the first entry.
class ItemCatalog {
 public:
  ItemCatalog() = default;
  explicit ItemCatalog(std::vector<ItemCatalogEntry> entries);

  /// Case-insensitive lookup by canonical name; nullptr if absent.
  [[nodiscard]] const ItemCatalogEntry* find(std::string_view name) const;

  [[nodiscard]] const std::vector<ItemCatalogEntry>& entries() const noexcept {
    return entries_;
  }

  /// Candidates ordered longest name first (ties keep load order), so more
  /// specific names are tried before shorter generic ones.
  [[nodiscard]] const std::vector<MatchCandidate>& candidates() const noexcept {
    return candidates_;
  }

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

 private:
  std::vector<ItemCatalogEntry> entries_;
  std::vector<MatchCandidate> candidates_;
};

using CatalogSnapshot = std::shared_ptr<const ItemCatalog>;

/// Shared empty catalog; matches nothing.
[[nodiscard]] CatalogSnapshot empty_catalog();

[[nodiscard]] CatalogSnapshot make_catalog(std::vector<ItemCatalogEntry> entries);

/// Supplies the matchable vocabulary of a location. May return an empty list.
class IItemCatalogProvider {
 public:
  virtual ~IItemCatalogProvider() = default;

  [[nodiscard]] virtual std::expected<std::vector<ItemCatalogEntry>, LootError>
  load(std::string_view location) = 0;
};

}  // namespace lootwatch::core
