#include <lootwatch/app/catalog_provider.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

namespace la = lootwatch::app;
namespace lc = lootwatch::core;

namespace {

std::filesystem::path write_catalog() {
  const auto path = std::filesystem::temp_directory_path() / "lootwatch_catalog_test.txt";
  std::ofstream out(path);
  out << "# location|id|name\n"
      << "Polly Forest|1|Polly's Feather\n"
      << "Polly Forest | 2 | Black Stone \n"
      << "\n"
      << "Polly Forest|x|Broken Id\n"
      << "Sausan Garrison|10|Sausan's Emblem\n"
      << "Sausan Garrison|11|Memory Fragment|extra\n";
  return path;
}

}  // namespace

TEST(FileCatalogProvider, LoadsEntriesForLocation) {
  la::FileCatalogProvider provider(write_catalog());
  auto entries = provider.load("Polly Forest");
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[0].id, 1u);
  EXPECT_EQ((*entries)[0].name, "Polly's Feather");
  EXPECT_EQ((*entries)[1].id, 2u);
  EXPECT_EQ((*entries)[1].name, "Black Stone");
}

TEST(FileCatalogProvider, NameMayContainSeparator) {
  la::FileCatalogProvider provider(write_catalog());
  auto entries = provider.load("Sausan Garrison");
  ASSERT_TRUE(entries.has_value());
  ASSERT_EQ(entries->size(), 2u);
  EXPECT_EQ((*entries)[1].name, "Memory Fragment|extra");
}

TEST(FileCatalogProvider, UnknownLocation) {
  la::FileCatalogProvider provider(write_catalog());
  auto entries = provider.load("Nowhere");
  ASSERT_FALSE(entries.has_value());
  EXPECT_EQ(entries.error(), lc::LootError::NoCatalog);
}

TEST(FileCatalogProvider, MissingFile) {
  la::FileCatalogProvider provider("/nonexistent/items.txt");
  auto entries = provider.load("Polly Forest");
  ASSERT_FALSE(entries.has_value());
  EXPECT_EQ(entries.error(), lc::LootError::LoadFailed);
}

TEST(InMemoryCatalogProvider, LoadsAddedLocations) {
  la::InMemoryCatalogProvider provider;
  provider.add("Polly Forest", {{1, "Polly's Feather"}});
  auto entries = provider.load("Polly Forest");
  ASSERT_TRUE(entries.has_value());
  EXPECT_EQ(entries->size(), 1u);
  EXPECT_FALSE(provider.load("Nowhere").has_value());
}
