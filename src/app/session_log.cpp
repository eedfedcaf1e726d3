#include <lootwatch/app/session_log.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace lootwatch::app {

namespace lc = lootwatch::core;

std::string format_iso8601(std::chrono::system_clock::time_point t) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch());
  const std::time_t seconds = std::chrono::system_clock::to_time_t(t);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << ((ms.count() % 1000) + 1000) % 1000 << 'Z';
  return out.str();
}

bool SessionLog::open(const std::filesystem::path& path,
                      std::chrono::system_clock::time_point start,
                      const lc::Region& region,
                      std::chrono::milliseconds interval) {
  out_.open(path, std::ios::out | std::ios::app);
  if (!out_) {
    CV_LOG_WARNING(NULL, "session log: cannot open " << path.string());
    return false;
  }
  start_ = start;
  out_ << "=== Loot session started " << format_iso8601(start) << " ===\n"
       << "Region: x=" << region.x << " y=" << region.y << " width=" << region.width
       << " height=" << region.height << '\n'
       << "Capture interval: " << interval.count() << "ms\n"
       << "------------------------------------------------------------\n";
  out_.flush();
  return true;
}

void SessionLog::detection(std::chrono::system_clock::time_point at,
                           const lc::LootMatch& match,
                           double processing_ms) {
  if (!out_.is_open()) return;
  out_ << '[' << format_iso8601(at) << "] [" << lc::to_string(match.method) << "] "
       << match.original_text << " (" << std::fixed << std::setprecision(2) << match.confidence
       << ", " << std::setprecision(0) << processing_ms << "ms)\n";
  out_.flush();
}

void SessionLog::close(std::chrono::system_clock::time_point end, const lc::SessionStats& stats) {
  if (!out_.is_open()) return;
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_);
  out_ << "------------------------------------------------------------\n"
       << "=== Loot session ended " << format_iso8601(end) << " ===\n"
       << "Duration: " << duration.count() / 1000 << "s\n"
       << "Capture attempts: " << stats.captures_attempted
       << " (succeeded " << stats.captures_succeeded << ", skipped " << stats.captures_skipped
       << ", failed " << stats.captures_failed << ")\n"
       << "Items detected: " << stats.items_detected << '\n'
       << "Average processing time: " << std::fixed << std::setprecision(1)
       << stats.average_processing_ms << "ms\n\n";
  out_.close();
}

}  // namespace lootwatch::app
