#include <lootwatch/app/session_log.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace la = lootwatch::app;
namespace lc = lootwatch::core;

namespace {

std::string read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

}  // namespace

TEST(SessionLog, FormatsIso8601) {
  const auto t = std::chrono::system_clock::time_point{} + std::chrono::seconds(1700000000) +
                 std::chrono::milliseconds(42);
  EXPECT_EQ(la::format_iso8601(t), "2023-11-14T22:13:20.042Z");
}

TEST(SessionLog, WritesHeaderLinesAndFooter) {
  const auto path = std::filesystem::temp_directory_path() / "lootwatch_session_log_test.log";
  std::filesystem::remove(path);
  const auto start = std::chrono::system_clock::time_point{} + std::chrono::seconds(1700000000);

  la::SessionLog log;
  ASSERT_TRUE(log.open(path, start, {10, 20, 350, 300}, std::chrono::milliseconds(250)));
  EXPECT_TRUE(log.is_open());

  lc::LootMatch m;
  m.item = "Black Stone";
  m.original_text = "Black Stone x3";
  m.confidence = 0.92f;
  m.method = lc::MatchMethod::Exact;
  log.detection(start + std::chrono::seconds(1), m, 41.2);

  lc::SessionStats stats;
  stats.captures_attempted = 12;
  stats.items_detected = 1;
  stats.average_processing_ms = 20.0;
  log.close(start + std::chrono::seconds(90), stats);
  EXPECT_FALSE(log.is_open());

  const std::string text = read_file(path);
  EXPECT_NE(text.find("started 2023-11-14T22:13:20.000Z"), std::string::npos);
  EXPECT_NE(text.find("x=10 y=20 width=350 height=300"), std::string::npos);
  EXPECT_NE(text.find("Capture interval: 250ms"), std::string::npos);
  EXPECT_NE(text.find("[2023-11-14T22:13:21.000Z] [EXACT] Black Stone x3 (0.92, 41ms)"),
            std::string::npos);
  EXPECT_NE(text.find("Duration: 90s"), std::string::npos);
  EXPECT_NE(text.find("Capture attempts: 12"), std::string::npos);
  EXPECT_NE(text.find("Average processing time: 20.0ms"), std::string::npos);
}

TEST(SessionLog, ClosedLogIgnoresWrites) {
  la::SessionLog log;
  lc::LootMatch m;
  log.detection(std::chrono::system_clock::now(), m, 1.0);
  log.close(std::chrono::system_clock::now(), {});
  EXPECT_FALSE(log.is_open());
}
