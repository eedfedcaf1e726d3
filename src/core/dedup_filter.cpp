#include <lootwatch/core/dedup_filter.hpp>
#include <lootwatch/core/text_correction.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace lootwatch::core {

DeduplicationFilter::DeduplicationFilter(DedupConfig config, int region_height)
    : config_(config) {
  if (config_.row_count < 1) config_.row_count = 1;
  const float height = region_height > 0 ? static_cast<float>(region_height) : 1.f;
  row_height_ = height / static_cast<float>(config_.row_count);
}

int DeduplicationFilter::row_for(float top) const noexcept {
  const int row = static_cast<int>(std::floor(top / row_height_));
  return std::clamp(row, 0, config_.row_count - 1);
}

void DeduplicationFilter::purge(Millis now) {
  std::erase_if(recent_, [&](const RecentReading& r) {
    return now - r.reading.timestamp >= config_.window;
  });
}

std::size_t DeduplicationFilter::burst_count(std::string_view text, int row, Millis now) const {
  return static_cast<std::size_t>(std::count_if(
      recent_.begin(), recent_.end(), [&](const RecentReading& r) {
        return r.row == row && now - r.reading.timestamp < config_.burst_window &&
               trim_view(r.reading.text) == text;
      }));
}

bool DeduplicationFilter::accept(const OcrReading& reading) {
  const std::string_view text = trim_view(reading.text);
  if (text.empty()) return false;

  const Millis now = reading.timestamp;
  purge(now);

  const int row = row_for(reading.top());

  for (const auto& recent : recent_) {
    if (trim_view(recent.reading.text) != text) continue;

    const Millis dt = now - recent.reading.timestamp;

    if (recent.row == row && dt < config_.same_row_window) {
      const std::size_t burst = burst_count(text, row, now);
      if (dt < config_.burst_window || burst >= config_.burst_min_count) {
        CV_LOG_DEBUG(NULL, "dedup: burst \"" << text << "\" row " << row << " dt="
                               << dt.count() << "ms count=" << burst + 1);
        continue;
      }
      CV_LOG_DEBUG(NULL, "dedup: re-read \"" << text << "\" row " << row << " dt="
                             << dt.count() << "ms");
      return false;
    }

    if (recent.row != row && dt < config_.push_up_window && row == recent.row - 1) {
      CV_LOG_DEBUG(NULL, "dedup: push-up \"" << text << "\" row " << recent.row << " -> "
                             << row << " dt=" << dt.count() << "ms");
      return false;
    }
  }

  recent_.push_back(RecentReading{reading, row});
  CV_LOG_DEBUG(NULL, "dedup: new \"" << text << "\" row " << row);
  return true;
}

}  // namespace lootwatch::core
