#include <lootwatch/core/loot_pipeline.hpp>
#include <chrono>

namespace lootwatch::core {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - since);
  return 1e-3 * static_cast<double>(us.count());
}

}  // namespace

LootPipeline::LootPipeline(DedupConfig dedup,
                           int region_height,
                           MatcherConfig matcher,
                           SessionLedger::NowFn now)
    : dedup_(dedup, region_height), matcher_(matcher), ledger_(std::move(now)) {}

std::optional<LootMatch> LootPipeline::process(const OcrReading& reading,
                                               ReadingOutcome* outcome,
                                               StageTimingCallback* timing_cb) {
  auto set_outcome = [outcome](ReadingOutcome o) {
    if (outcome) *outcome = o;
  };

  auto stage_start = std::chrono::steady_clock::now();
  const bool fresh = dedup_.accept(reading);
  if (timing_cb) (*timing_cb)(0, elapsed_ms(stage_start));
  if (!fresh) {
    set_outcome(ReadingOutcome::Duplicate);
    return std::nullopt;
  }

  // Hold the snapshot for the duration of the match.
  const CatalogSnapshot catalog = ledger_.catalog();
  stage_start = std::chrono::steady_clock::now();
  auto match = matcher_.match(reading, *catalog);
  if (timing_cb) (*timing_cb)(1, elapsed_ms(stage_start));
  if (!match) {
    set_outcome(ReadingOutcome::Unmatched);
    return std::nullopt;
  }

  stage_start = std::chrono::steady_clock::now();
  auto recorded = ledger_.record_match(*match);
  if (timing_cb) (*timing_cb)(2, elapsed_ms(stage_start));
  if (!recorded) {
    set_outcome(ReadingOutcome::NotRecorded);
    return std::nullopt;
  }

  set_outcome(ReadingOutcome::Recorded);
  return match;
}

std::vector<LootMatch> LootPipeline::process_all(std::span<const OcrReading> readings) {
  std::vector<LootMatch> out;
  for (const auto& r : readings) {
    if (auto m = process(r)) {
      out.push_back(std::move(*m));
    }
  }
  return out;
}

}  // namespace lootwatch::core
