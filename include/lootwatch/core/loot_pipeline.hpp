#pragma once

#include <lootwatch/core/dedup_filter.hpp>
#include <lootwatch/core/item_matcher.hpp>
#include <lootwatch/core/loot_match.hpp>
#include <lootwatch/core/ocr_reading.hpp>
#include <lootwatch/core/session_ledger.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace lootwatch::core {

/// Per-stage timing: (stage_index, duration_ms); 0 = dedup, 1 = match, 2 = ledger.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Outcome of one reading through the pipeline.
enum class ReadingOutcome : std::uint8_t {
  Duplicate,   // rejected by the dedup filter
  Unmatched,   // new, but no catalog item matched
  NotRecorded, // matched, but the ledger has no active session
  Recorded,
};

/// DeduplicationFilter -> ItemMatcher -> SessionLedger, one reading at a time.
/// Owns all three; the catalog is read from the ledger's current snapshot for
/// every reading. Not thread-safe.
class LootPipeline {
 public:
  LootPipeline(DedupConfig dedup,
               int region_height,
               MatcherConfig matcher = {},
               SessionLedger::NowFn now = {});

  /// Runs one reading through the chain; returns the match if it was recorded.
  /// If timing_cb is non-null, it is called after each stage that ran.
  std::optional<LootMatch> process(const OcrReading& reading,
                                   ReadingOutcome* outcome = nullptr,
                                   StageTimingCallback* timing_cb = nullptr);

  /// Processes readings in order; returns recorded matches.
  std::vector<LootMatch> process_all(std::span<const OcrReading> readings);

  [[nodiscard]] SessionLedger& ledger() noexcept { return ledger_; }
  [[nodiscard]] const SessionLedger& ledger() const noexcept { return ledger_; }
  [[nodiscard]] DeduplicationFilter& dedup() noexcept { return dedup_; }
  [[nodiscard]] const ItemMatcher& matcher() const noexcept { return matcher_; }

 private:
  DeduplicationFilter dedup_;
  ItemMatcher matcher_;
  SessionLedger ledger_;
};

}  // namespace lootwatch::core
