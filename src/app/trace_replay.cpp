#include <lootwatch/app/trace_replay.hpp>
#include <lootwatch/core/loot_pipeline.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <atomic>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace lootwatch::app {

namespace lc = lootwatch::core;

namespace {

std::string_view trim(std::string_view s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

bool parse_float(std::string_view text, float& out) {
  const std::string copy(trim(text));
  if (copy.empty()) return false;
  char* end = nullptr;
  out = std::strtof(copy.c_str(), &end);
  return end == copy.c_str() + copy.size();
}

std::optional<lc::OcrReading> parse_trace_line(std::string_view line) {
  std::string_view fields[3];
  std::size_t pos = 0;
  for (auto& field : fields) {
    const auto bar = line.find('|', pos);
    if (bar == std::string_view::npos) return std::nullopt;
    field = line.substr(pos, bar - pos);
    pos = bar + 1;
  }

  const std::string_view t_text = trim(fields[0]);
  std::int64_t t_ms = 0;
  auto [ptr, ec] = std::from_chars(t_text.data(), t_text.data() + t_text.size(), t_ms);
  if (ec != std::errc{} || ptr != t_text.data() + t_text.size()) return std::nullopt;

  float top = 0.f;
  float confidence = 0.f;
  if (!parse_float(fields[1], top) || !parse_float(fields[2], confidence)) return std::nullopt;

  lc::OcrReading reading;
  reading.text.assign(line.substr(pos));
  reading.confidence = confidence;
  reading.bbox = lc::make_quad(0.f, top, 0.f, 0.f);
  reading.timestamp = lc::Millis(t_ms);
  return reading;
}

}  // namespace

std::expected<std::vector<lc::OcrReading>, lc::LootError> parse_trace(std::istream& in) {
  std::vector<lc::OcrReading> readings;
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::string_view text = trim(line);
    if (text.empty() || text.front() == '#') continue;
    auto reading = parse_trace_line(line);
    if (!reading) {
      CV_LOG_ERROR(NULL, "trace: line " << line_no << " is not t_ms|top_y|confidence|text");
      return std::unexpected(lc::LootError::LoadFailed);
    }
    readings.push_back(std::move(*reading));
  }
  return readings;
}

std::expected<std::vector<lc::OcrReading>, lc::LootError>
load_trace(const std::filesystem::path& path) {
  std::ifstream f(path);
  if (!f) {
    CV_LOG_ERROR(NULL, "trace: cannot open " << path.string());
    return std::unexpected(lc::LootError::LoadFailed);
  }
  return parse_trace(f);
}

ReplayResult replay_trace(std::span<const lc::OcrReading> trace, const ReplayOptions& options) {
  lc::LootPipeline pipeline(options.dedup, options.region_height, options.matcher);
  pipeline.ledger().set_location(options.location, options.catalog);

  ReplayResult result;
  if (auto started = pipeline.ledger().start(); !started) {
    CV_LOG_ERROR(NULL, "trace: cannot start replay: " << lc::to_string(started.error()));
    return result;
  }

  for (const auto& reading : trace) {
    ++result.readings;
    lc::ReadingOutcome outcome = lc::ReadingOutcome::Duplicate;
    pipeline.process(reading, &outcome);
    if (outcome != lc::ReadingOutcome::Duplicate) ++result.accepted;
    if (outcome == lc::ReadingOutcome::Recorded) ++result.recorded;
  }

  const lc::SessionSummary summary = pipeline.ledger().summary();
  result.loot = summary.loot;
  result.item_count = summary.item_count;
  return result;
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

DedupEvaluation evaluate_one(std::span<const lc::OcrReading> trace,
                             const ReplayOptions& base,
                             const lc::DedupConfig& candidate,
                             std::uint64_t expected_items) {
  ReplayOptions options = base;
  options.dedup = candidate;
  DedupEvaluation eval;
  eval.config = candidate;
  eval.result = replay_trace(trace, options);
  const std::uint64_t got = eval.result.item_count;
  eval.abs_error = got > expected_items ? got - expected_items : expected_items - got;
  return eval;
}

}  // namespace

std::vector<DedupEvaluation>
evaluate_dedup_configs(std::span<const lc::OcrReading> trace,
                       const ReplayOptions& base,
                       const std::vector<lc::DedupConfig>& candidates,
                       std::uint64_t expected_items,
                       std::size_t num_workers) {
  const std::size_t n = candidates.size();
  std::vector<DedupEvaluation> results(n);
  if (n == 0) return results;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    for (std::size_t i = 0; i < n; ++i) {
      results[i] = evaluate_one(trace, base, candidates[i], expected_items);
    }
    return results;
  }

  // Each slot of `results` is written by exactly one worker.
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t i = next.fetch_add(1); i < n; i = next.fetch_add(1)) {
      results[i] = evaluate_one(trace, base, candidates[i], expected_items);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
  return results;
}

}  // namespace lootwatch::app
