#include <lootwatch/app/config.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace lootwatch::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

/// Whole-string integer parse; leaves `out` untouched on failure.
template <typename T>
bool parse_int(const std::string& value, T& out) {
  T parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) return false;
  out = parsed;
  return true;
}

bool parse_float(const std::string& value, float& out) {
  if (value.empty()) return false;
  char* end = nullptr;
  const float parsed = std::strtof(value.c_str(), &end);
  if (end != value.c_str() + value.size()) return false;
  out = parsed;
  return true;
}

bool parse_bool(const std::string& value, bool& out) {
  if (value == "true" || value == "1" || value == "yes") {
    out = true;
    return true;
  }
  if (value == "false" || value == "0" || value == "no") {
    out = false;
    return true;
  }
  return false;
}

bool parse_millis(const std::string& value, std::chrono::milliseconds& out) {
  std::int64_t ms = 0;
  if (!parse_int(value, ms)) return false;
  out = std::chrono::milliseconds(ms);
  return true;
}

}  // namespace

bool valid_capture_interval(std::chrono::milliseconds interval) noexcept {
  return interval >= kMinCaptureInterval && interval <= kMaxCaptureInterval;
}

bool interval_fits_dedup(std::chrono::milliseconds interval,
                         const lootwatch::core::DedupConfig& dedup) noexcept {
  return interval >= dedup.burst_window;
}

std::expected<lootwatch::core::Region, lootwatch::core::LootError>
capture_region(const AppConfig& config) {
  return lootwatch::core::normalize_region(config.region);
}

AppConfig default_config() {
  AppConfig c;
  c.region = lootwatch::core::Region{0, 0, 350, 300};
  c.interval = std::chrono::milliseconds(250);
  c.ocr_backend = OcrBackendType::Mock;
  c.capture_backend = CaptureBackendType::Mock;
  c.ocr_timeout = std::chrono::milliseconds(2000);
  c.queue_capacity = 8;
  c.log_level = "info";
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    CV_LOG_WARNING(NULL, "config: cannot open " << path << ", using defaults");
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    bool ok = true;
    if (key == "region_x") ok = parse_int(value, c.region.x);
    else if (key == "region_y") ok = parse_int(value, c.region.y);
    else if (key == "region_width") ok = parse_int(value, c.region.width);
    else if (key == "region_height") ok = parse_int(value, c.region.height);
    else if (key == "interval_ms") ok = parse_millis(value, c.interval);
    else if (key == "location") c.location = value;
    else if (key == "catalog_path") c.catalog_path = value;
    else if (key == "session_log_path") c.session_log_path = value;
    else if (key == "ocr_backend") {
      if (value == "onnx") c.ocr_backend = OcrBackendType::Onnx;
      else if (value == "mock") c.ocr_backend = OcrBackendType::Mock;
      else ok = false;
    }
    else if (key == "ocr_model_path") c.ocr_model_path = value;
    else if (key == "ocr_dict_path") c.ocr_dict_path = value;
    else if (key == "ocr_timeout_ms") ok = parse_millis(value, c.ocr_timeout);
    else if (key == "capture_backend") {
      if (value == "images") c.capture_backend = CaptureBackendType::Images;
      else if (value == "mock") c.capture_backend = CaptureBackendType::Mock;
      else ok = false;
    }
    else if (key == "capture_image_dir") c.capture_image_dir = value;
    else if (key == "queue_capacity") ok = parse_int(value, c.queue_capacity);
    else if (key == "dedup_window_ms") ok = parse_millis(value, c.dedup.window);
    else if (key == "same_row_window_ms") ok = parse_millis(value, c.dedup.same_row_window);
    else if (key == "burst_window_ms") ok = parse_millis(value, c.dedup.burst_window);
    else if (key == "burst_min_count") ok = parse_int(value, c.dedup.burst_min_count);
    else if (key == "push_up_window_ms") ok = parse_millis(value, c.dedup.push_up_window);
    else if (key == "row_count") ok = parse_int(value, c.dedup.row_count);
    else if (key == "fuzzy_ratio") ok = parse_float(value, c.matcher.fuzzy_ratio);
    else if (key == "fuzzy_confidence_scale") ok = parse_float(value, c.matcher.fuzzy_confidence_scale);
    else if (key == "max_quantity") ok = parse_int(value, c.matcher.max_quantity);
    else if (key == "log_level") c.log_level = value;
    else if (key == "value_pack") ok = parse_bool(value, c.value_pack);
    else if (key == "rich_merchant_ring") ok = parse_bool(value, c.rich_merchant_ring);
    else if (key == "family_fame") ok = parse_int(value, c.family_fame);

    if (!ok) {
      CV_LOG_WARNING(NULL, "config: " << path << ":" << line_no << ": bad value for "
                                      << key << ", keeping default");
    }
  }
  return c;
}

}  // namespace lootwatch::app
