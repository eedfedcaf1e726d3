#pragma once

#include <lootwatch/core/dedup_filter.hpp>
#include <lootwatch/core/error.hpp>
#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/item_matcher.hpp>
#include <lootwatch/core/ocr_reading.hpp>
#include <lootwatch/core/session_ledger.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <istream>
#include <span>
#include <string>
#include <vector>

namespace lootwatch::app {

/// Parse a recorded reading trace: one reading per line, `t_ms|top_y|confidence|text`
/// (text is everything after the third '|'). Blank lines and '#' comments are
/// skipped. A malformed line fails the whole parse with LoadFailed.
std::expected<std::vector<lootwatch::core::OcrReading>, lootwatch::core::LootError>
parse_trace(std::istream& in);

/// parse_trace over a file; LoadFailed if it cannot be opened.
std::expected<std::vector<lootwatch::core::OcrReading>, lootwatch::core::LootError>
load_trace(const std::filesystem::path& path);

struct ReplayOptions {
  lootwatch::core::DedupConfig dedup;
  lootwatch::core::MatcherConfig matcher;
  int region_height{300};
  std::string location{"replay"};
  lootwatch::core::CatalogSnapshot catalog;
};

struct ReplayResult {
  lootwatch::core::LootCounts loot;
  std::size_t readings{0};
  std::size_t accepted{0};  // passed the dedup filter
  std::size_t recorded{0};  // matched and counted
  std::uint64_t item_count{0};
};

/// Feeds the readings (in order) through a fresh dedup -> matcher -> ledger chain.
[[nodiscard]] ReplayResult replay_trace(std::span<const lootwatch::core::OcrReading> trace,
                                        const ReplayOptions& options);

/// Result of one candidate threshold set.
struct DedupEvaluation {
  lootwatch::core::DedupConfig config;
  ReplayResult result;
  std::uint64_t abs_error{0};  // |result.item_count - expected_items|
};

/// Replays `trace` once per candidate (each with its own pipeline) on a thread
/// pool and scores each against the known number of picked-up items. Results
/// are in candidate order. num_workers 0 = use hardware concurrency.
[[nodiscard]] std::vector<DedupEvaluation>
evaluate_dedup_configs(std::span<const lootwatch::core::OcrReading> trace,
                       const ReplayOptions& base,
                       const std::vector<lootwatch::core::DedupConfig>& candidates,
                       std::uint64_t expected_items,
                       std::size_t num_workers = 0);

}  // namespace lootwatch::app
