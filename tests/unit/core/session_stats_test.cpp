#include <lootwatch/core/session_stats.hpp>
#include <gtest/gtest.h>
#include <chrono>

namespace lc = lootwatch::core;

TEST(StatsTracker, CountsOutcomes) {
  lc::StatsTracker tracker;
  const auto t0 = std::chrono::system_clock::now();
  tracker.reset(t0);
  tracker.record_tick(lc::TickOutcome::Succeeded, 10.0, t0);
  tracker.record_tick(lc::TickOutcome::Skipped, 1.0, t0);
  tracker.record_tick(lc::TickOutcome::Failed, 2.0, t0);
  tracker.record_tick(lc::TickOutcome::TimedOut, 50.0, t0);
  tracker.record_detection();
  tracker.record_dropped_tick();

  const auto& s = tracker.stats();
  EXPECT_EQ(s.captures_attempted, 4u);
  EXPECT_EQ(s.captures_succeeded, 1u);
  EXPECT_EQ(s.captures_skipped, 1u);
  EXPECT_EQ(s.captures_failed, 2u);
  EXPECT_EQ(s.ocr_timeouts, 1u);
  EXPECT_EQ(s.items_detected, 1u);
  EXPECT_EQ(s.ticks_dropped, 1u);
  EXPECT_EQ(s.captures_attempted,
            s.captures_succeeded + s.captures_skipped + s.captures_failed);
  ASSERT_TRUE(s.session_start.has_value());
  EXPECT_DOUBLE_EQ(s.average_processing_ms, 63.0 / 4.0);
}

TEST(StatsTracker, AverageUsesSlidingWindow) {
  lc::StatsTracker tracker;
  const auto t0 = std::chrono::system_clock::now();
  tracker.reset(t0);
  for (std::size_t i = 0; i < lc::StatsTracker::kLatencyWindow; ++i) {
    tracker.record_tick(lc::TickOutcome::Succeeded, 100.0, t0);
  }
  for (std::size_t i = 0; i < lc::StatsTracker::kLatencyWindow; ++i) {
    tracker.record_tick(lc::TickOutcome::Succeeded, 10.0, t0);
  }
  EXPECT_DOUBLE_EQ(tracker.stats().average_processing_ms, 10.0);
  EXPECT_DOUBLE_EQ(tracker.stats().total_processing_ms, 100.0 * 100 + 10.0 * 100);
}

TEST(StatsTracker, ResetClearsEverything) {
  lc::StatsTracker tracker;
  const auto t0 = std::chrono::system_clock::now();
  tracker.reset(t0);
  tracker.record_tick(lc::TickOutcome::Succeeded, 5.0, t0);
  tracker.reset(t0);
  EXPECT_EQ(tracker.stats().captures_attempted, 0u);
  EXPECT_DOUBLE_EQ(tracker.stats().average_processing_ms, 0.0);
  EXPECT_FALSE(tracker.stats().last_capture_time.has_value());
}
