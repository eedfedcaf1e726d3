#include <lootwatch/core/text_correction.hpp>
#include <gtest/gtest.h>

namespace lc = lootwatch::core;

TEST(TextCorrection, NormalizeLowercasesTrimsAndCollapses) {
  EXPECT_EQ(lc::normalize_text("  Black   STONE \t"), "black stone");
  EXPECT_EQ(lc::normalize_text(""), "");
  EXPECT_EQ(lc::normalize_text("   "), "");
}

TEST(TextCorrection, NormalizeDropsApostrophes) {
  EXPECT_EQ(lc::normalize_text("Polly's Feather"), "pollys feather");
  EXPECT_EQ(lc::normalize_text("Polly\xE2\x80\x99s Feather"), "pollys feather");
}

TEST(TextCorrection, ConfusionTable) {
  EXPECT_EQ(lc::correct_ocr_confusions("|0518 6"), "losib g");
  EXPECT_EQ(lc::correct_ocr_confusions("b1ack st0ne"), "biack stone");
  EXPECT_EQ(lc::correct_ocr_confusions("plain"), "plain");
}

TEST(TextCorrection, ConfusionKeyFoldsOneClass) {
  EXPECT_EQ(lc::confusion_key("black"), lc::confusion_key("b1ack"));
  EXPECT_EQ(lc::confusion_key("black"), lc::confusion_key("b|ack"));
  EXPECT_EQ(lc::confusion_key("st0ne").size(), 5u);
}

TEST(TextCorrection, ContainsPhraseRespectsWordBoundaries) {
  EXPECT_TRUE(lc::contains_phrase("black stone", "black stone"));
  EXPECT_TRUE(lc::contains_phrase("looted black stone x3", "black stone"));
  EXPECT_TRUE(lc::contains_phrase("[black stone]", "black stone"));
  EXPECT_FALSE(lc::contains_phrase("caphras stone", "black stone"));
  EXPECT_TRUE(lc::contains_phrase("caphras stone", "stone"));
  EXPECT_FALSE(lc::contains_phrase("gemstone", "stone"));
  EXPECT_FALSE(lc::contains_phrase("stones", "stone"));
  EXPECT_FALSE(lc::contains_phrase("stone", ""));
}

TEST(TextCorrection, TrimView) {
  EXPECT_EQ(lc::trim_view("  a b \n"), "a b");
  EXPECT_EQ(lc::trim_view(" \t "), "");
}
