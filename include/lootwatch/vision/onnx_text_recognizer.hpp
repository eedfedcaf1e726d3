#pragma once

#include <lootwatch/core/error.hpp>
#include <lootwatch/core/frame.hpp>
#include <lootwatch/vision/ocr_engine.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lootwatch::vision {

struct TextRecognizerOptions {
  int row_count{5};            // fixed notification slots, one text line each
  std::int64_t input_height{48};  // used when the model's height is dynamic
  std::int64_t max_width{320};
  float min_confidence{0.5f};
};

/// ONNX Runtime text-line recognizer (CRNN / PaddleOCR rec layout).
///
/// The capture region is split into `row_count` equal horizontal bands, one per
/// notification slot; each band is recognized as one text line, so no text
/// detection model is needed. Expected model: one input [1,3,H,W] (W may be
/// dynamic) and one output [1,T,C] of per-step class probabilities, where class
/// 0 is the CTC blank and classes 1..N map to the lines of the dictionary file
/// (a trailing space class is appended). Decoding is greedy CTC; the reading's
/// confidence is the mean probability of the emitted characters and its bbox is
/// the band rectangle. Bands that decode to nothing or fall below
/// min_confidence are dropped.
///
/// Not thread-safe: one recognize() at a time.
class OnnxTextRecognizer : public IOcrEngine {
 public:
  /// \param model_path Path to the .onnx recognition model.
  /// \param dict_path Character dictionary, one UTF-8 symbol per line.
  /// Throws Ort::Exception if the model cannot be loaded and std::runtime_error
  /// on an unusable model shape or dictionary.
  OnnxTextRecognizer(const std::filesystem::path& model_path,
                     const std::filesystem::path& dict_path,
                     TextRecognizerOptions options = {});

  ~OnnxTextRecognizer() override;

  OnnxTextRecognizer(const OnnxTextRecognizer&) = delete;
  OnnxTextRecognizer& operator=(const OnnxTextRecognizer&) = delete;

  [[nodiscard]] std::expected<std::vector<lootwatch::core::OcrReading>,
                              lootwatch::core::LootError>
  recognize(const lootwatch::core::Frame& input) override;

  [[nodiscard]] std::expected<void, lootwatch::core::LootError>
  validate_input(const lootwatch::core::Frame& input) const override;

  void warmup() override;

  [[nodiscard]] std::string_view name() const noexcept override { return "onnx-rec"; }

  [[nodiscard]] std::size_t dictionary_size() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

/// Greedy CTC decode of a [T, C] probability matrix (row-major). Class 0 is the
/// blank; class k > 0 maps to symbols[k - 1]. Repeated classes collapse unless
/// separated by a blank. Returns text and mean probability of emitted symbols
/// (0 if none).
struct CtcDecoded {
  std::string text;
  float confidence{0.f};
};
[[nodiscard]] CtcDecoded ctc_greedy_decode(const float* probs,
                                           std::int64_t steps,
                                           std::int64_t classes,
                                           const std::vector<std::string>& symbols);

}  // namespace lootwatch::vision
