#pragma once

#include <lootwatch/core/dedup_filter.hpp>
#include <lootwatch/core/error.hpp>
#include <lootwatch/core/item_matcher.hpp>
#include <lootwatch/core/region.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace lootwatch::app {

/// OCR engine type: mock (scripted) or onnx (real recognizer).
enum class OcrBackendType {
  Mock,
  Onnx,
};

/// Screen source: mock (blank frames) or images (recorded screenshots).
enum class CaptureBackendType {
  Mock,
  Images,
};

inline constexpr std::chrono::milliseconds kMinCaptureInterval{16};
inline constexpr std::chrono::milliseconds kMaxCaptureInterval{5000};

/// Application configuration: region, timing, collaborators, thresholds.
struct AppConfig {
  lootwatch::core::Region region{0, 0, 350, 300};
  std::chrono::milliseconds interval{250};
  std::string location;
  std::string catalog_path;
  std::string session_log_path;  // empty: no session log

  OcrBackendType ocr_backend{OcrBackendType::Mock};
  std::string ocr_model_path;
  std::string ocr_dict_path;
  std::chrono::milliseconds ocr_timeout{2000};

  CaptureBackendType capture_backend{CaptureBackendType::Mock};
  std::string capture_image_dir;

  std::size_t queue_capacity{8};

  lootwatch::core::DedupConfig dedup;
  lootwatch::core::MatcherConfig matcher;

  std::string log_level{"info"};

  bool value_pack{false};
  bool rich_merchant_ring{false};
  std::int64_t family_fame{0};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys are ignored; values that fail to parse keep the default.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// True if `interval` is within [kMinCaptureInterval, kMaxCaptureInterval].
[[nodiscard]] bool valid_capture_interval(std::chrono::milliseconds interval) noexcept;

/// Ticks closer together than the burst window would make every re-read of
/// one notification look like a burst of new pickups.
[[nodiscard]] bool interval_fits_dedup(std::chrono::milliseconds interval,
                                       const lootwatch::core::DedupConfig& dedup) noexcept;

/// The configured region, normalized; InvalidRegion if it is too small.
[[nodiscard]] std::expected<lootwatch::core::Region, lootwatch::core::LootError>
capture_region(const AppConfig& config);

}  // namespace lootwatch::app
