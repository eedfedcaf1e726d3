#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/text_correction.hpp>
#include <algorithm>
#include <unordered_set>

namespace lootwatch::core {

ItemCatalog::ItemCatalog(std::vector<ItemCatalogEntry> entries) {
  std::unordered_set<std::string> seen;
  entries_.reserve(entries.size());
  for (auto& e : entries) {
    std::string lowered = normalize_text(e.name);
    if (lowered.empty() || !seen.insert(lowered).second) continue;

    MatchCandidate c;
    c.id = e.id;
    c.name = e.name;
    c.confusion = confusion_key(lowered);
    c.lowered = std::move(lowered);
    candidates_.push_back(std::move(c));
    entries_.push_back(std::move(e));
  }
  std::stable_sort(candidates_.begin(), candidates_.end(),
                   [](const MatchCandidate& a, const MatchCandidate& b) {
                     return a.lowered.size() > b.lowered.size();
                   });
}

const ItemCatalogEntry* ItemCatalog::find(std::string_view name) const {
  const std::string key = normalize_text(name);
  const auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&key](const ItemCatalogEntry& e) {
                                 return normalize_text(e.name) == key;
                               });
  return it == entries_.end() ? nullptr : &*it;
}

CatalogSnapshot empty_catalog() {
  static const CatalogSnapshot kEmpty = std::make_shared<const ItemCatalog>();
  return kEmpty;
}

CatalogSnapshot make_catalog(std::vector<ItemCatalogEntry> entries) {
  return std::make_shared<const ItemCatalog>(std::move(entries));
}

}  // namespace lootwatch::core
