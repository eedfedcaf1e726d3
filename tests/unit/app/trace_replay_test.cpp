#include <lootwatch/app/trace_replay.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <vector>

namespace la = lootwatch::app;
namespace lc = lootwatch::core;

namespace {

// Two real pickups of Black Stone: the first is re-read and pushed up, the
// second arrives after the same-row window.
constexpr const char* kTrace =
    "# t_ms|top_y|confidence|text\n"
    "0|245|0.93|Black Stone\n"
    "250|245|0.91|Black Stone\n"
    "400|185|0.90|Black Stone\n"
    "500|245|0.88|Memory Fragment x3\n"
    "2000|245|0.92|Black Stone\n"
    "2250|245|0.40|   \n";

la::ReplayOptions options() {
  la::ReplayOptions o;
  o.region_height = 300;
  o.location = "Polly Forest";
  o.catalog = lc::make_catalog({{1, "Black Stone"}, {2, "Memory Fragment"}});
  return o;
}

}  // namespace

TEST(TraceReplay, ParsesTrace) {
  std::istringstream in(kTrace);
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());
  ASSERT_EQ(trace->size(), 6u);
  EXPECT_EQ((*trace)[0].timestamp.count(), 0);
  EXPECT_FLOAT_EQ((*trace)[2].top(), 185.f);
  EXPECT_FLOAT_EQ((*trace)[3].confidence, 0.88f);
  EXPECT_EQ((*trace)[3].text, "Memory Fragment x3");
}

TEST(TraceReplay, TextKeepsSeparators) {
  std::istringstream in("10|0|0.9|Odd|Name\n");
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());
  ASSERT_EQ(trace->size(), 1u);
  EXPECT_EQ((*trace)[0].text, "Odd|Name");
}

TEST(TraceReplay, MalformedLineFails) {
  std::istringstream in("0|245|0.9|Black Stone\nsoon|245|0.9|Black Stone\n");
  auto trace = la::parse_trace(in);
  ASSERT_FALSE(trace.has_value());
  EXPECT_EQ(trace.error(), lc::LootError::LoadFailed);
}

TEST(TraceReplay, MissingFileFails) {
  auto trace = la::load_trace("/nonexistent/trace.txt");
  ASSERT_FALSE(trace.has_value());
  EXPECT_EQ(trace.error(), lc::LootError::LoadFailed);
}

TEST(TraceReplay, ReplaysThroughPipeline) {
  std::istringstream in(kTrace);
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());

  const la::ReplayResult r = la::replay_trace(*trace, options());
  EXPECT_EQ(r.readings, 6u);
  EXPECT_EQ(r.accepted, 3u);
  EXPECT_EQ(r.recorded, 3u);
  EXPECT_EQ(r.loot.at("Black Stone"), 2u);
  EXPECT_EQ(r.loot.at("Memory Fragment"), 3u);
  EXPECT_EQ(r.item_count, 5u);
}

TEST(TraceReplay, WithoutCatalogNothingIsRecorded) {
  std::istringstream in(kTrace);
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());
  la::ReplayOptions o = options();
  o.catalog = nullptr;
  const la::ReplayResult r = la::replay_trace(*trace, o);
  EXPECT_EQ(r.accepted, 3u);
  EXPECT_EQ(r.recorded, 0u);
  EXPECT_TRUE(r.loot.empty());
}

TEST(TraceReplay, EvaluatesCandidatesInParallel) {
  std::istringstream in(kTrace);
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());

  lc::DedupConfig tuned;
  lc::DedupConfig no_push_up;
  no_push_up.push_up_window = lc::Millis(0);
  lc::DedupConfig long_window;
  long_window.same_row_window = lc::Millis(2500);
  const std::vector<lc::DedupConfig> candidates{tuned, no_push_up, long_window, tuned};

  const auto evals = la::evaluate_dedup_configs(*trace, options(), candidates, 5, 3);
  ASSERT_EQ(evals.size(), 4u);
  EXPECT_EQ(evals[0].result.item_count, 5u);
  EXPECT_EQ(evals[0].abs_error, 0u);
  // The push-up read counts as a third Black Stone.
  EXPECT_EQ(evals[1].result.item_count, 6u);
  EXPECT_EQ(evals[1].abs_error, 1u);
  // The second real pickup is swallowed as a re-read.
  EXPECT_EQ(evals[2].result.item_count, 4u);
  EXPECT_EQ(evals[2].abs_error, 1u);
  EXPECT_EQ(evals[3].result.item_count, evals[0].result.item_count);
}

TEST(TraceReplay, EvaluateSingleWorkerMatchesParallel) {
  std::istringstream in(kTrace);
  auto trace = la::parse_trace(in);
  ASSERT_TRUE(trace.has_value());
  const std::vector<lc::DedupConfig> candidates(3);
  const auto serial = la::evaluate_dedup_configs(*trace, options(), candidates, 5, 1);
  const auto parallel = la::evaluate_dedup_configs(*trace, options(), candidates, 5, 0);
  ASSERT_EQ(serial.size(), parallel.size());
  for (std::size_t i = 0; i < serial.size(); ++i) {
    EXPECT_EQ(serial[i].result.loot, parallel[i].result.loot);
  }
  EXPECT_TRUE(la::evaluate_dedup_configs(*trace, options(), {}, 5).empty());
}
