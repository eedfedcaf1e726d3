#pragma once

#include <lootwatch/core/loot_match.hpp>
#include <lootwatch/core/region.hpp>
#include <lootwatch/core/session_stats.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace lootwatch::app {

/// `2026-01-31T12:00:00.250Z` (UTC, millisecond precision).
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point t);

/// Append-only text log of one capture session: a header block at open, one
/// line per accepted detection and a footer block at close.
///
///   [<iso>] [EXACT] Black Stone x3 (0.92, 41ms)
///
/// Not thread-safe; written by the scheduler worker only (header and footer
/// from start/stop while the worker is not running).
class SessionLog {
 public:
  SessionLog() = default;
  SessionLog(const SessionLog&) = delete;
  SessionLog& operator=(const SessionLog&) = delete;

  /// Opens `path` for appending and writes the header. False if it cannot be opened.
  bool open(const std::filesystem::path& path,
            std::chrono::system_clock::time_point start,
            const lootwatch::core::Region& region,
            std::chrono::milliseconds interval);

  void detection(std::chrono::system_clock::time_point at,
                 const lootwatch::core::LootMatch& match,
                 double processing_ms);

  /// Writes the footer and closes the file. No-op if not open.
  void close(std::chrono::system_clock::time_point end,
             const lootwatch::core::SessionStats& stats);

  [[nodiscard]] bool is_open() const { return out_.is_open(); }

 private:
  std::ofstream out_;
  std::chrono::system_clock::time_point start_;
};

}  // namespace lootwatch::app
