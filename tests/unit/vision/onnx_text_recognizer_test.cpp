// Unit tests for OnnxTextRecognizer.
// CTC decoding and the missing-file constructor run without a model. The rest need a
// PaddleOCR-style recognition model: set LOOTWATCH_TEST_ONNX_MODEL to the .onnx file and
// LOOTWATCH_TEST_ONNX_DICT to its character dictionary. They are skipped otherwise.
#include <lootwatch/core/error.hpp>
#include <lootwatch/core/frame.hpp>
#include <lootwatch/vision/mock_screen_capture.hpp>
#include <lootwatch/vision/onnx_text_recognizer.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace lc = lootwatch::core;
namespace lv = lootwatch::vision;

static std::string env_path(const char* name) {
  const char* env = std::getenv(name);
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static std::string write_dictionary() {
  const auto path = std::filesystem::temp_directory_path() / "lootwatch_test_dict.txt";
  std::ofstream out(path);
  out << "a\nb\nc\n";
  return path.string();
}

// --- Tests that run without a model ---

TEST(CtcGreedyDecode, CollapsesRepeatsAndBlanks) {
  const std::vector<std::string> symbols{"a", "b", "c"};
  // Classes: 0 blank, 1 a, 2 b, 3 c. Steps: a a blank a b b
  const std::vector<float> probs{
      0.1f, 0.9f, 0.0f, 0.0f,
      0.1f, 0.8f, 0.1f, 0.0f,
      0.9f, 0.1f, 0.0f, 0.0f,
      0.3f, 0.7f, 0.0f, 0.0f,
      0.0f, 0.0f, 1.0f, 0.0f,
      0.0f, 0.0f, 0.6f, 0.4f,
  };
  const lv::CtcDecoded d = lv::ctc_greedy_decode(probs.data(), 6, 4, symbols);
  EXPECT_EQ(d.text, "aab");
  EXPECT_FLOAT_EQ(d.confidence, (0.9f + 0.7f + 1.0f) / 3.f);
}

TEST(CtcGreedyDecode, AllBlank) {
  const std::vector<std::string> symbols{"a"};
  const std::vector<float> probs{1.f, 0.f, 1.f, 0.f};
  const lv::CtcDecoded d = lv::ctc_greedy_decode(probs.data(), 2, 2, symbols);
  EXPECT_TRUE(d.text.empty());
  EXPECT_FLOAT_EQ(d.confidence, 0.f);
}

TEST(OnnxTextRecognizer, ConstructorThrowsWhenModelMissing) {
  const std::string dict = write_dictionary();
  EXPECT_THROW(
      { lv::OnnxTextRecognizer rec("nonexistent_rec_model_12345.onnx", dict); },
      Ort::Exception);
}

TEST(OnnxTextRecognizer, ConstructorThrowsWhenDictionaryMissing) {
  EXPECT_THROW(
      { lv::OnnxTextRecognizer rec("nonexistent_rec_model_12345.onnx", "nonexistent_dict.txt"); },
      std::runtime_error);
}

// --- Tests that require a real model ---

TEST(OnnxTextRecognizer, RecognizesBlankRegionAsNothing) {
  const std::string model = env_path("LOOTWATCH_TEST_ONNX_MODEL");
  const std::string dict = env_path("LOOTWATCH_TEST_ONNX_DICT");
  if (model.empty() || dict.empty()) {
    GTEST_SKIP() << "Set LOOTWATCH_TEST_ONNX_MODEL and LOOTWATCH_TEST_ONNX_DICT to run";
  }
  lv::OnnxTextRecognizer rec(model, dict);
  EXPECT_GT(rec.dictionary_size(), 1u);
  EXPECT_NO_THROW(rec.warmup());
  auto out = rec.recognize(lv::make_solid_frame(350, 300, 0));
  ASSERT_TRUE(out.has_value());
  for (const auto& r : *out) {
    EXPECT_GE(r.confidence, 0.5f);
    EXPECT_LE(r.confidence, 1.f);
  }
}

TEST(OnnxTextRecognizer, ValidateInputRejectsEmptyFrame) {
  const std::string model = env_path("LOOTWATCH_TEST_ONNX_MODEL");
  const std::string dict = env_path("LOOTWATCH_TEST_ONNX_DICT");
  if (model.empty() || dict.empty()) {
    GTEST_SKIP() << "Set LOOTWATCH_TEST_ONNX_MODEL and LOOTWATCH_TEST_ONNX_DICT to run";
  }
  lv::OnnxTextRecognizer rec(model, dict);
  auto valid = rec.validate_input(lc::Frame{});
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), lc::LootError::InvalidFrame);
}
