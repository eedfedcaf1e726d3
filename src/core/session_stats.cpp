#include <lootwatch/core/session_stats.hpp>

namespace lootwatch::core {

void StatsTracker::reset(std::chrono::system_clock::time_point session_start) {
  stats_ = SessionStats{};
  stats_.session_start = session_start;
  latencies_.clear();
  window_sum_ = 0.0;
}

void StatsTracker::record_tick(TickOutcome outcome,
                               double processing_ms,
                               std::chrono::system_clock::time_point capture_time) {
  ++stats_.captures_attempted;
  switch (outcome) {
    case TickOutcome::Succeeded:
      ++stats_.captures_succeeded;
      stats_.last_capture_time = capture_time;
      break;
    case TickOutcome::Skipped:
      ++stats_.captures_skipped;
      stats_.last_capture_time = capture_time;
      break;
    case TickOutcome::TimedOut:
      ++stats_.ocr_timeouts;
      ++stats_.captures_failed;
      break;
    case TickOutcome::Failed:
      ++stats_.captures_failed;
      break;
  }

  stats_.total_processing_ms += processing_ms;
  latencies_.push_back(processing_ms);
  window_sum_ += processing_ms;
  if (latencies_.size() > kLatencyWindow) {
    window_sum_ -= latencies_.front();
    latencies_.pop_front();
  }
  stats_.average_processing_ms = window_sum_ / static_cast<double>(latencies_.size());
}

}  // namespace lootwatch::core
