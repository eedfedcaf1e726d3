/**
 * lootwatch-cli: watch the loot feed region, or replay a recorded reading trace.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/apps/lootwatch-cli/lootwatch_cli [--config path] [--duration-ms N]
 *        ./build/apps/lootwatch-cli/lootwatch_cli --trace readings.txt --catalog items.txt --location "Polly Forest"
 */

#include <lootwatch/app/capture_scheduler.hpp>
#include <lootwatch/app/catalog_provider.hpp>
#include <lootwatch/app/config.hpp>
#include <lootwatch/app/logging.hpp>
#include <lootwatch/app/trace_replay.hpp>
#include <lootwatch/core/error.hpp>
#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/tax.hpp>
#include <lootwatch/vision/image_sequence_capture.hpp>
#include <lootwatch/vision/mock_ocr_engine.hpp>
#include <lootwatch/vision/mock_screen_capture.hpp>
#include <lootwatch/vision/onnx_text_recognizer.hpp>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

namespace la = lootwatch::app;
namespace lc = lootwatch::core;
namespace lv = lootwatch::vision;

std::shared_ptr<lv::IScreenCapture> build_capture(const la::AppConfig& cfg,
                                                  const lc::Region& region) {
  if (cfg.capture_backend == la::CaptureBackendType::Images) {
    if (cfg.capture_image_dir.empty()) {
      throw std::runtime_error("capture_backend=images requires capture_image_dir to be set in config");
    }
    return std::make_shared<lv::ImageSequenceCapture>(cfg.capture_image_dir);
  }
  auto mock = std::make_shared<lv::MockScreenCapture>();
  mock->set_default_frame(lv::make_solid_frame(static_cast<std::uint32_t>(region.width),
                                               static_cast<std::uint32_t>(region.height), 0));
  return mock;
}

std::shared_ptr<lv::IOcrEngine> build_ocr(const la::AppConfig& cfg) {
  if (cfg.ocr_backend == la::OcrBackendType::Onnx) {
    if (cfg.ocr_model_path.empty() || cfg.ocr_dict_path.empty()) {
      throw std::runtime_error("ocr_backend=onnx requires ocr_model_path and ocr_dict_path to be set in config");
    }
    lv::TextRecognizerOptions options;
    options.row_count = cfg.dedup.row_count;
    auto onnx = std::make_shared<lv::OnnxTextRecognizer>(cfg.ocr_model_path, cfg.ocr_dict_path, options);
    onnx->warmup();
    return onnx;
  }
  return std::make_shared<lv::MockOcrEngine>();
}

lc::CatalogSnapshot load_catalog(const la::AppConfig& cfg) {
  if (cfg.catalog_path.empty()) return lc::empty_catalog();
  la::FileCatalogProvider provider(cfg.catalog_path);
  auto entries = provider.load(cfg.location);
  if (!entries) {
    std::cerr << "Warning: no catalog for \"" << cfg.location << "\" in " << cfg.catalog_path
              << " (" << lc::to_string(entries.error()) << "); nothing will match\n";
    return lc::empty_catalog();
  }
  return lc::make_catalog(std::move(*entries));
}

bool parse_count(std::string_view text, std::int64_t& out) {
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) return false;
  out = value;
  return true;
}

void print_loot(const lc::LootCounts& loot) {
  for (const auto& [item, count] : loot) {
    std::cout << "  " << item << ": " << count << "\n";
  }
}

int run_trace(const la::AppConfig& cfg, const std::string& trace_path, std::int64_t expected) {
  auto trace = la::load_trace(trace_path);
  if (!trace) {
    std::cerr << "Failed to load trace: " << trace_path << " (" << lc::to_string(trace.error()) << ")\n";
    return 1;
  }

  la::ReplayOptions options;
  options.dedup = cfg.dedup;
  options.matcher = cfg.matcher;
  options.region_height = cfg.region.height;
  options.location = cfg.location.empty() ? "replay" : cfg.location;
  options.catalog = load_catalog(cfg);

  const la::ReplayResult result = la::replay_trace(*trace, options);
  std::cout << "readings=" << result.readings << " accepted=" << result.accepted
            << " recorded=" << result.recorded << " items=" << result.item_count << "\n";
  print_loot(result.loot);

  if (expected < 0) return 0;

  // Scale every threshold together around the configured values.
  std::vector<lc::DedupConfig> candidates;
  for (const double scale : {0.5, 0.75, 1.0, 1.25, 1.5, 2.0}) {
    lc::DedupConfig c = cfg.dedup;
    c.same_row_window = lc::Millis(static_cast<std::int64_t>(c.same_row_window.count() * scale));
    c.burst_window = lc::Millis(static_cast<std::int64_t>(c.burst_window.count() * scale));
    c.push_up_window = lc::Millis(static_cast<std::int64_t>(c.push_up_window.count() * scale));
    candidates.push_back(c);
  }
  const auto evaluations =
      la::evaluate_dedup_configs(*trace, options, candidates, static_cast<std::uint64_t>(expected));
  std::cout << "calibration (expected " << expected << " items):\n";
  for (const auto& e : evaluations) {
    std::cout << "  same_row=" << e.config.same_row_window.count()
              << "ms burst=" << e.config.burst_window.count()
              << "ms push_up=" << e.config.push_up_window.count()
              << "ms -> items=" << e.result.item_count << " error=" << e.abs_error << "\n";
  }
  return 0;
}

int run_live(const la::AppConfig& cfg, std::chrono::milliseconds duration) {
  auto region = la::capture_region(cfg);
  if (!region) {
    std::cerr << "Cannot start session: " << lc::to_string(region.error()) << " (region "
              << cfg.region.width << "x" << cfg.region.height << ")\n";
    return 1;
  }
  la::CaptureScheduler scheduler(build_capture(cfg, *region), build_ocr(cfg));
  scheduler.on_detection([](const la::DetectionRecord& d) {
    std::cout << "[" << lc::to_string(d.method) << "] " << d.item << " x" << d.quantity
              << " (" << d.confidence << ")\n";
  });

  la::ScheduleConfig schedule;
  schedule.region = *region;
  schedule.interval = cfg.interval;
  schedule.location = cfg.location;
  schedule.catalog = load_catalog(cfg);
  schedule.dedup = cfg.dedup;
  schedule.matcher = cfg.matcher;
  schedule.ocr_timeout = cfg.ocr_timeout;
  schedule.queue_capacity = cfg.queue_capacity;
  schedule.session_log_path = cfg.session_log_path;

  auto started = scheduler.start_session(std::move(schedule));
  if (!started) {
    std::cerr << "Cannot start session: " << lc::to_string(started.error()) << "\n";
    return 1;
  }
  std::this_thread::sleep_for(duration);
  auto stats = scheduler.stop_session();
  if (!stats) {
    std::cerr << "Cannot stop session: " << lc::to_string(stats.error()) << "\n";
    return 1;
  }

  std::cout << "captures attempted=" << stats->captures_attempted
            << " succeeded=" << stats->captures_succeeded
            << " skipped=" << stats->captures_skipped
            << " failed=" << stats->captures_failed
            << " (timeouts " << stats->ocr_timeouts << ")"
            << " dropped=" << stats->ticks_dropped
            << " avg=" << stats->average_processing_ms << "ms\n";

  if (auto summary = scheduler.session_summary()) {
    std::cout << "location=" << summary->location << " duration=" << summary->duration.count()
              << "ms items=" << summary->item_count << "\n";
    print_loot(summary->loot);
    std::cout << "silver=" << summary->silver << " after tax="
              << lc::post_tax_value(summary->total_value, cfg.value_pack, cfg.rich_merchant_ring,
                                    cfg.family_fame)
              << "\n";
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string trace_path;
  std::string location_override;
  std::string catalog_override;
  std::string log_override;
  std::int64_t duration_ms = 5000;
  std::int64_t expected = -1;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--trace" && i + 1 < argc) {
      trace_path = argv[++i];
    } else if (arg == "--location" && i + 1 < argc) {
      location_override = argv[++i];
    } else if (arg == "--catalog" && i + 1 < argc) {
      catalog_override = argv[++i];
    } else if (arg == "--log" && i + 1 < argc) {
      log_override = argv[++i];
    } else if (arg == "--duration-ms" && i + 1 < argc) {
      if (!parse_count(argv[++i], duration_ms)) {
        std::cerr << "Invalid --duration-ms " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--expected" && i + 1 < argc) {
      if (!parse_count(argv[++i], expected)) {
        std::cerr << "Invalid --expected " << argv[i] << "\n";
        return 1;
      }
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: lootwatch_cli [options]\n"
                << "  --config <path>      key=value config file; default: built-in (mock capture and OCR)\n"
                << "  --location <name>    Hunting location (catalog key)\n"
                << "  --catalog <path>     Catalog file, lines of location|id|name\n"
                << "  --log <path>         Append the session log to this file\n"
                << "  --duration-ms <n>    Live session length (default 5000)\n"
                << "  --trace <path>       Replay a reading trace (t_ms|top_y|confidence|text) instead\n"
                << "  --expected <n>       With --trace: score dedup thresholds against n real pickups\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  la::AppConfig cfg = config_path.empty() ? la::default_config() : la::load_config(config_path);
  if (!location_override.empty()) cfg.location = location_override;
  if (!catalog_override.empty()) cfg.catalog_path = catalog_override;
  if (!log_override.empty()) cfg.session_log_path = log_override;
  if (!la::configure_logging(cfg.log_level)) {
    std::cerr << "Unknown log_level " << cfg.log_level << ", using info\n";
  }

  try {
    if (!trace_path.empty()) {
      return run_trace(cfg, trace_path, expected);
    }
    return run_live(cfg, std::chrono::milliseconds(duration_ms));
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
