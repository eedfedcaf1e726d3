#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/item_matcher.hpp>
#include <gtest/gtest.h>
#include <string>

namespace lc = lootwatch::core;

namespace {

lc::OcrReading reading(std::string text, float confidence = 0.9f) {
  lc::OcrReading r;
  r.text = std::move(text);
  r.confidence = confidence;
  r.bbox = lc::make_quad(0.f, 240.f, 200.f, 20.f);
  return r;
}

}  // namespace

TEST(ItemMatcher, ExactMatch) {
  lc::ItemCatalog catalog({{7, "Black Stone"}});
  lc::ItemMatcher matcher;
  auto m = matcher.match(reading("Black Stone"), catalog);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->item, "Black Stone");
  EXPECT_EQ(m->method, lc::MatchMethod::Exact);
  EXPECT_EQ(m->quantity, 1u);
  EXPECT_FLOAT_EQ(m->confidence, 0.9f);
  EXPECT_EQ(m->original_text, "Black Stone");
  ASSERT_TRUE(m->item_id.has_value());
  EXPECT_EQ(*m->item_id, 7u);
}

TEST(ItemMatcher, WordBoundaryBlocksSharedSuffix) {
  lc::ItemCatalog catalog({{1, "Black Stone"}});
  lc::ItemMatcher matcher;
  EXPECT_FALSE(matcher.match(reading("Caphras Stone"), catalog).has_value());
}

TEST(ItemMatcher, LongestNameWins) {
  lc::ItemCatalog catalog({{1, "Stone"}, {2, "Caphras Stone"}});
  lc::ItemMatcher matcher;
  auto m = matcher.match(reading("Caphras Stone"), catalog);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->item, "Caphras Stone");
}

TEST(ItemMatcher, CorrectsOcrConfusions) {
  lc::ItemCatalog catalog({{1, "Black Stone"}});
  lc::ItemMatcher matcher;
  auto m = matcher.match(reading("B1ack St0ne"), catalog);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->item, "Black Stone");
  EXPECT_EQ(m->method, lc::MatchMethod::Exact);
}

TEST(ItemMatcher, QuantityExtraction) {
  lc::ItemCatalog catalog({{1, "Memory Fragment"}});
  lc::ItemMatcher matcher;

  auto twelve = matcher.match(reading("Memory Fragment x12"), catalog);
  ASSERT_TRUE(twelve.has_value());
  EXPECT_EQ(twelve->quantity, 12u);

  auto plain = matcher.match(reading("Memory Fragment"), catalog);
  ASSERT_TRUE(plain.has_value());
  EXPECT_EQ(plain->quantity, 1u);

  auto huge = matcher.match(reading("Memory Fragment x1500"), catalog);
  ASSERT_TRUE(huge.has_value());
  EXPECT_EQ(huge->quantity, 1u);
}

TEST(ItemMatcher, QuantityTokens) {
  lc::ItemMatcher matcher;
  EXPECT_EQ(matcher.extract_quantity("Black Stone x5"), 5u);
  EXPECT_EQ(matcher.extract_quantity("5x Black Stone"), 5u);
  EXPECT_EQ(matcher.extract_quantity("Black Stone \xC3\x97" "3"), 3u);
  EXPECT_EQ(matcher.extract_quantity("Black Stone *2"), 2u);
  EXPECT_EQ(matcher.extract_quantity("Black Stone X 4"), 4u);
  EXPECT_FALSE(matcher.extract_quantity("Black Stone").has_value());
  EXPECT_FALSE(matcher.extract_quantity("Black Stone x0").has_value());
  EXPECT_FALSE(matcher.extract_quantity("Black Stone x1000").has_value());
  EXPECT_FALSE(matcher.extract_quantity("Box9").has_value());
}

TEST(ItemMatcher, FuzzyMatchScalesConfidence) {
  lc::ItemCatalog catalog({{1, "Memory Fragment"}});
  lc::ItemMatcher matcher;
  // Last two letters lost to the fade-out.
  auto m = matcher.match(reading("Memory Fragme", 0.5f), catalog);
  ASSERT_TRUE(m.has_value());
  EXPECT_EQ(m->method, lc::MatchMethod::Fuzzy);
  EXPECT_FLOAT_EQ(m->confidence, 0.4f);
}

TEST(ItemMatcher, FuzzyLengthGuard) {
  lc::ItemCatalog catalog({{1, "Ruby"}});
  lc::ItemMatcher matcher;
  const std::string sentence =
      "The merchant rolled out the rubyred carpet for the visiting nobles of Calpheon";
  ASSERT_GT(sentence.size(), 2 * std::string("Ruby").size());
  EXPECT_FALSE(matcher.match(reading(sentence), catalog).has_value());

  // Short enough for the guard: the same substring does fuzzy-match.
  auto short_hit = matcher.match(reading("rubyred"), catalog);
  ASSERT_TRUE(short_hit.has_value());
  EXPECT_EQ(short_hit->method, lc::MatchMethod::Fuzzy);
}

TEST(ItemMatcher, ShortNamesNeverFuzzy) {
  lc::ItemCatalog catalog({{1, "Ore"}});
  lc::ItemMatcher matcher;
  EXPECT_FALSE(matcher.match(reading("ores"), catalog).has_value());
  EXPECT_TRUE(matcher.match(reading("Ore"), catalog).has_value());
}

TEST(ItemMatcher, EmptyInputs) {
  lc::ItemMatcher matcher;
  lc::ItemCatalog catalog({{1, "Black Stone"}});
  EXPECT_FALSE(matcher.match(reading("   "), catalog).has_value());
  EXPECT_FALSE(matcher.match(reading("Black Stone"), lc::ItemCatalog{}).has_value());
}
