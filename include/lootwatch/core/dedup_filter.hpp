#pragma once

#include <lootwatch/core/ocr_reading.hpp>
#include <cstddef>
#include <deque>

namespace lootwatch::core {

/// Timing thresholds of the notification-stack model. The defaults are tuned
/// against the game's loot feed (five slots, ~1.5 s fade); recalibrate them with
/// app::evaluate_dedup_configs when the client's animation timing changes.
struct DedupConfig {
  Millis window{3000};           // retention of past readings
  Millis same_row_window{1500};  // same text, same row: re-read of one notification
  Millis burst_window{200};      // identical drops rendered back to back
  std::size_t burst_min_count{2};
  Millis push_up_window{500};    // same text one row higher: FIFO shift
  int row_count{5};
};

/// A reading retained for comparison against later ones.
struct RecentReading {
  OcrReading reading;
  int row{0};
};

/// Decides which readings are new pickups.
///
/// The loot feed is a fixed stack of row_count slots: new entries appear in the
/// bottom slot and push older ones up until they fade. The same notification is
/// therefore re-read every tick in the same slot, and read again one slot higher
/// after a push. A reading is rejected when, for some retained reading with the
/// identical (trimmed) text:
///  - it sits in the same row less than same_row_window ago, unless it is itself
///    within burst_window of it or at least burst_min_count identical readings
///    landed in that row within the last burst_window (a burst of real drops);
///  - it sat exactly one row lower less than push_up_window ago.
/// Empty or whitespace-only text is always rejected. Accepted readings are
/// retained; retained readings expire after `window`.
///
/// Not thread-safe: owned and driven by a single consumer, with
/// monotonically increasing timestamps.
class DeduplicationFilter {
 public:
  DeduplicationFilter(DedupConfig config, int region_height);

  /// Returns true if the reading is a new pickup and should be emitted.
  [[nodiscard]] bool accept(const OcrReading& reading);

  /// Row bucket of a y coordinate, clamped to [0, row_count - 1].
  [[nodiscard]] int row_for(float top) const noexcept;

  [[nodiscard]] std::size_t retained_count() const noexcept { return recent_.size(); }
  [[nodiscard]] const DedupConfig& config() const noexcept { return config_; }
  [[nodiscard]] float row_height() const noexcept { return row_height_; }

  void reset() noexcept { recent_.clear(); }

 private:
  void purge(Millis now);
  [[nodiscard]] std::size_t burst_count(std::string_view text, int row, Millis now) const;

  DedupConfig config_;
  float row_height_;
  std::deque<RecentReading> recent_;
};

}  // namespace lootwatch::core
