#include <lootwatch/app/catalog_provider.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <charconv>
#include <fstream>

namespace lootwatch::app {

namespace lc = lootwatch::core;

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

}  // namespace

FileCatalogProvider::FileCatalogProvider(std::filesystem::path path) : path_(std::move(path)) {}

std::expected<std::vector<lc::ItemCatalogEntry>, lc::LootError>
FileCatalogProvider::load(std::string_view location) {
  std::ifstream f(path_);
  if (!f) {
    CV_LOG_WARNING(NULL, "catalog: cannot open " << path_.string());
    return std::unexpected(lc::LootError::LoadFailed);
  }

  std::vector<lc::ItemCatalogEntry> entries;
  bool seen_location = false;
  std::string line;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    const std::string_view text = trim(line);
    if (text.empty() || text.front() == '#') continue;

    const auto first = text.find('|');
    const auto second = first == std::string_view::npos ? first : text.find('|', first + 1);
    if (second == std::string_view::npos) {
      CV_LOG_WARNING(NULL, "catalog: " << path_.string() << ":" << line_no << ": malformed line");
      continue;
    }
    if (trim(text.substr(0, first)) != location) continue;
    seen_location = true;

    const std::string_view id_text = trim(text.substr(first + 1, second - first - 1));
    const std::string_view name = trim(text.substr(second + 1));
    lc::ItemCatalogEntry entry;
    auto [ptr, ec] = std::from_chars(id_text.data(), id_text.data() + id_text.size(), entry.id);
    if (ec != std::errc{} || ptr != id_text.data() + id_text.size() || name.empty()) {
      CV_LOG_WARNING(NULL, "catalog: " << path_.string() << ":" << line_no << ": bad entry");
      continue;
    }
    entry.name.assign(name);
    entries.push_back(std::move(entry));
  }

  if (!seen_location) {
    return std::unexpected(lc::LootError::NoCatalog);
  }
  return entries;
}

void InMemoryCatalogProvider::add(std::string location,
                                  std::vector<lc::ItemCatalogEntry> entries) {
  catalogs_[std::move(location)] = std::move(entries);
}

std::expected<std::vector<lc::ItemCatalogEntry>, lc::LootError>
InMemoryCatalogProvider::load(std::string_view location) {
  const auto it = catalogs_.find(location);
  if (it == catalogs_.end()) {
    return std::unexpected(lc::LootError::NoCatalog);
  }
  return it->second;
}

}  // namespace lootwatch::app
