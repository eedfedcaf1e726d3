#include <lootwatch/vision/onnx_text_recognizer.hpp>
#include "frame_cv_utils.hpp"
#include <lootwatch/core/ocr_reading.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lootwatch::vision {

namespace lc = lootwatch::core;

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

std::vector<std::string> LoadDictionary(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("OnnxTextRecognizer: cannot open dictionary " + path.string());
  }
  std::vector<std::string> symbols;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    symbols.push_back(line);
  }
  if (symbols.empty()) {
    throw std::runtime_error("OnnxTextRecognizer: empty dictionary " + path.string());
  }
  symbols.emplace_back(" ");
  return symbols;
}

/// Resized BGR band (H x W, 8-bit) to NCHW floats normalized to [-1, 1].
void BgrToNchw(const cv::Mat& bgr, float* nchw) {
  const int h = bgr.rows;
  const int w = bgr.cols;
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (int y = 0; y < h; ++y) {
    const auto* row = bgr.ptr<cv::Vec3b>(y);
    for (int x = 0; x < w; ++x) {
      const std::size_t idx = static_cast<std::size_t>(y) * w + x;
      for (int c = 0; c < kNumChannels; ++c) {
        nchw[c * hw + idx] = (row[x][c] / 255.f - 0.5f) / 0.5f;
      }
    }
  }
}

}  // namespace

CtcDecoded ctc_greedy_decode(const float* probs,
                             std::int64_t steps,
                             std::int64_t classes,
                             const std::vector<std::string>& symbols) {
  CtcDecoded decoded;
  if (probs == nullptr || steps <= 0 || classes <= 0) return decoded;

  float score_sum = 0.f;
  std::size_t emitted = 0;
  std::int64_t previous = 0;
  for (std::int64_t t = 0; t < steps; ++t) {
    const float* step = probs + t * classes;
    const auto best = std::max_element(step, step + classes);
    const std::int64_t cls = best - step;
    if (cls != 0 && cls != previous) {
      const auto symbol = static_cast<std::size_t>(cls - 1);
      if (symbol < symbols.size()) {
        decoded.text += symbols[symbol];
        score_sum += *best;
        ++emitted;
      }
    }
    previous = cls;
  }
  if (emitted > 0) {
    decoded.confidence = score_sum / static_cast<float>(emitted);
  }
  return decoded;
}

struct OnnxTextRecognizer::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "lootwatch"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::string output_name;

  std::int64_t input_height{48};
  std::int64_t fixed_width{-1};  // -1: dynamic width
  TextRecognizerOptions options;
  std::vector<std::string> symbols;

  std::vector<float> nchw_buffer;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }

  std::expected<CtcDecoded, lc::LootError> recognize_band(const cv::Mat& band);
};

std::expected<CtcDecoded, lc::LootError>
OnnxTextRecognizer::Impl::recognize_band(const cv::Mat& band) {
  const double scale = static_cast<double>(input_height) / std::max(band.rows, 1);
  std::int64_t width = fixed_width > 0
                           ? fixed_width
                           : static_cast<std::int64_t>(std::ceil(band.cols * scale));
  width = std::clamp<std::int64_t>(width, 8, std::max<std::int64_t>(options.max_width, 8));

  cv::Mat resized;
  cv::resize(band, resized, cv::Size(static_cast<int>(width), static_cast<int>(input_height)),
             0, 0, cv::INTER_LINEAR);

  const std::size_t num_floats =
      static_cast<std::size_t>(kNumChannels) * static_cast<std::size_t>(input_height * width);
  nchw_buffer.resize(num_floats);
  BgrToNchw(resized, nchw_buffer.data());

  const std::array<std::int64_t, 4> shape{1, kNumChannels, input_height, width};
  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, nchw_buffer.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {input_name.c_str()};
  const char* output_names_c[] = {output_name.c_str()};
  Ort::RunOptions run_options;
  std::vector<Ort::Value> outputs;
  try {
    outputs = session.Run(run_options, input_names_c, &input_tensor, 1,
                          output_names_c, 1);
  } catch (const Ort::Exception& e) {
    CV_LOG_ERROR(NULL, "lootwatch: recognizer run failed: " << e.what());
    return std::unexpected(lc::LootError::OcrFailed);
  }
  if (outputs.size() != 1u) {
    return std::unexpected(lc::LootError::OcrFailed);
  }

  const auto out_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  if (out_shape.size() != 3u || out_shape[0] != 1) {
    return std::unexpected(lc::LootError::OcrFailed);
  }
  return ctc_greedy_decode(outputs[0].GetTensorData<float>(), out_shape[1], out_shape[2],
                           symbols);
}

OnnxTextRecognizer::OnnxTextRecognizer(const std::filesystem::path& model_path,
                                       const std::filesystem::path& dict_path,
                                       TextRecognizerOptions options)
    : impl_(std::make_unique<Impl>()) {
  if (options.row_count <= 0) {
    throw std::runtime_error("OnnxTextRecognizer: row_count must be positive");
  }
  impl_->options = options;
  impl_->symbols = LoadDictionary(dict_path);
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0 || impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxTextRecognizer: model needs one input and one output");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const std::vector<std::int64_t> dims = input_type.GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u || dims[1] != kNumChannels) {
    throw std::runtime_error("OnnxTextRecognizer: expected input shape [1,3,H,W]");
  }
  impl_->input_height = dims[2] > 0 ? dims[2] : options.input_height;
  impl_->fixed_width = dims[3];

  CV_LOG_INFO(NULL, "lootwatch: recognizer loaded " << model_path.string() << " (H="
                                                    << impl_->input_height << ", "
                                                    << impl_->symbols.size() << " symbols)");
}

OnnxTextRecognizer::~OnnxTextRecognizer() = default;

std::size_t OnnxTextRecognizer::dictionary_size() const noexcept {
  return impl_->symbols.size();
}

std::expected<void, lc::LootError>
OnnxTextRecognizer::validate_input(const lc::Frame& input) const {
  if (!input.well_formed() ||
      input.height() < static_cast<std::uint32_t>(impl_->options.row_count)) {
    return std::unexpected(lc::LootError::InvalidFrame);
  }
  return {};
}

std::expected<std::vector<lc::OcrReading>, lc::LootError>
OnnxTextRecognizer::recognize(const lc::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const cv::Mat bgr = detail::frame_to_bgr(input);
  if (bgr.empty()) {
    return std::unexpected(lc::LootError::InvalidFrame);
  }

  const int rows = impl_->options.row_count;
  const int band_height = bgr.rows / rows;
  std::vector<lc::OcrReading> readings;
  for (int r = 0; r < rows; ++r) {
    const int y = r * band_height;
    const int h = (r == rows - 1) ? bgr.rows - y : band_height;
    auto decoded = impl_->recognize_band(bgr(cv::Rect(0, y, bgr.cols, h)));
    if (!decoded) {
      return std::unexpected(decoded.error());
    }
    if (decoded->text.empty() || decoded->confidence < impl_->options.min_confidence) {
      continue;
    }
    lc::OcrReading reading;
    reading.text = std::move(decoded->text);
    reading.confidence = decoded->confidence;
    reading.bbox = lc::make_quad(0.f, static_cast<float>(y), static_cast<float>(bgr.cols),
                                 static_cast<float>(h));
    readings.push_back(std::move(reading));
  }
  return readings;
}

void OnnxTextRecognizer::warmup() {
  const auto h = static_cast<int>(impl_->input_height);
  const int w = impl_->fixed_width > 0 ? static_cast<int>(impl_->fixed_width) : h * 4;
  const cv::Mat blank(h, w, CV_8UC3, cv::Scalar(0, 0, 0));
  (void)impl_->recognize_band(blank);
}

}  // namespace lootwatch::vision
