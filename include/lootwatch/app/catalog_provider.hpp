#pragma once

#include <lootwatch/core/item_catalog.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lootwatch::app {

/// Catalog file reader. Each non-comment line is `location|id|name`; blank
/// lines and lines starting with '#' are skipped. The file is read on every
/// load(), so edits show up at the next location change.
/// load() fails with LoadFailed if the file cannot be opened and NoCatalog if
/// it has no line for the location.
class FileCatalogProvider : public lootwatch::core::IItemCatalogProvider {
 public:
  explicit FileCatalogProvider(std::filesystem::path path);

  [[nodiscard]] std::expected<std::vector<lootwatch::core::ItemCatalogEntry>,
                              lootwatch::core::LootError>
  load(std::string_view location) override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

/// Fixed per-location lists. Unknown locations yield NoCatalog.
class InMemoryCatalogProvider : public lootwatch::core::IItemCatalogProvider {
 public:
  void add(std::string location, std::vector<lootwatch::core::ItemCatalogEntry> entries);

  [[nodiscard]] std::expected<std::vector<lootwatch::core::ItemCatalogEntry>,
                              lootwatch::core::LootError>
  load(std::string_view location) override;

 private:
  std::map<std::string, std::vector<lootwatch::core::ItemCatalogEntry>, std::less<>> catalogs_;
};

}  // namespace lootwatch::app
