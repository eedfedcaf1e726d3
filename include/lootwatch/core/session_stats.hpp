#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace lootwatch::core {

/// Running counters of one capture session. Plain value; copy to snapshot.
struct SessionStats {
  std::uint64_t captures_attempted{0};
  std::uint64_t captures_succeeded{0};
  std::uint64_t captures_failed{0};
  std::uint64_t captures_skipped{0};  // screen unchanged, OCR not run
  std::uint64_t ocr_timeouts{0};      // subset of captures_failed
  std::uint64_t ticks_dropped{0};     // queue full when the timer fired
  std::uint64_t items_detected{0};
  std::optional<std::chrono::system_clock::time_point> session_start;
  std::optional<std::chrono::system_clock::time_point> last_capture_time;
  double average_processing_ms{0.0};  // over the last kLatencyWindow ticks
  double total_processing_ms{0.0};
};

/// Tick outcome fed to StatsTracker.
enum class TickOutcome : std::uint8_t {
  Succeeded,
  Skipped,
  Failed,
  TimedOut,
};

/// Maintains SessionStats, including the sliding latency average.
class StatsTracker {
 public:
  static constexpr std::size_t kLatencyWindow = 100;

  void reset(std::chrono::system_clock::time_point session_start);

  void record_tick(TickOutcome outcome,
                   double processing_ms,
                   std::chrono::system_clock::time_point capture_time);
  void record_detection() noexcept { ++stats_.items_detected; }
  void record_dropped_tick() noexcept { ++stats_.ticks_dropped; }

  [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }

 private:
  SessionStats stats_;
  std::deque<double> latencies_;
  double window_sum_{0.0};
};

}  // namespace lootwatch::core
