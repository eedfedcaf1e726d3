#pragma once

#include <lootwatch/core/bounded_queue.hpp>
#include <lootwatch/core/error.hpp>
#include <lootwatch/core/item_catalog.hpp>
#include <lootwatch/core/loot_pipeline.hpp>
#include <lootwatch/core/region.hpp>
#include <lootwatch/core/session_ledger.hpp>
#include <lootwatch/core/session_stats.hpp>
#include <lootwatch/vision/ocr_engine.hpp>
#include <lootwatch/vision/screen_capture.hpp>
#include <lootwatch/app/session_log.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lootwatch::app {

/// Parameters of one capture session.
struct ScheduleConfig {
  lootwatch::core::Region region;
  std::chrono::milliseconds interval{250};
  std::string location;
  /// Vocabulary of the location. If null and catalog_provider is set, the
  /// catalog is loaded from the provider; a failed load degrades to an empty
  /// catalog.
  lootwatch::core::CatalogSnapshot catalog;
  std::shared_ptr<lootwatch::core::IItemCatalogProvider> catalog_provider;
  lootwatch::core::DedupConfig dedup;
  lootwatch::core::MatcherConfig matcher;
  std::chrono::milliseconds ocr_timeout{2000};
  std::size_t queue_capacity{8};
  std::string session_log_path;  // empty: no session log
};

/// One accepted, matched pickup as broadcast to listeners.
struct DetectionRecord {
  std::chrono::system_clock::time_point timestamp;
  std::string item;
  std::uint32_t quantity{1};
  std::string location;
  float confidence{0.f};
  lootwatch::core::MatchMethod method{lootwatch::core::MatchMethod::Exact};
  std::string original_text;
  lootwatch::core::Quad bbox{};
  double processing_ms{0.0};
};

struct SchedulerStatus {
  bool running{false};
  lootwatch::core::SessionStats stats;
  std::optional<ScheduleConfig> config;
};

/// Drives periodic capture -> OCR -> dedup -> match -> ledger cycles.
///
/// A producer thread enqueues one tick per interval into a bounded queue (ticks
/// that do not fit are dropped and counted); a single worker thread consumes
/// them in order, so at most one cycle is in flight. Each tick captures the
/// region, skips OCR when the frame hash equals the previous one, and otherwise
/// runs OCR bounded by ocr_timeout. Capture/OCR failures, timeouts and
/// exceptions thrown by the collaborators are counted and never stop the loop.
///
/// The public methods may be called from any thread; start_session and
/// stop_session are serialized, stats and detections are returned as copies.
class CaptureScheduler {
 public:
  /// Invoked on the worker thread once per recorded match. It may call
  /// stop_session(); the worker then exits after the callback returns.
  using DetectionCallback = std::function<void(const DetectionRecord&)>;

  static constexpr std::size_t kMaxRecentDetections = 1000;

  CaptureScheduler(std::shared_ptr<lootwatch::vision::IScreenCapture> capture,
                   std::shared_ptr<lootwatch::vision::IOcrEngine> ocr);
  ~CaptureScheduler();

  CaptureScheduler(const CaptureScheduler&) = delete;
  CaptureScheduler& operator=(const CaptureScheduler&) = delete;

  /// AlreadyRunning, InvalidRegion (after normalization), InvalidConfig
  /// (interval outside 16..5000 ms or shorter than dedup.burst_window) or
  /// NoLocation (empty location).
  std::expected<void, lootwatch::core::LootError> start_session(ScheduleConfig config);

  /// Stops both threads, discards queued ticks, ends the ledger session and
  /// returns the final stats. An OCR call still in flight is not waited for;
  /// its result is discarded when it completes. Called from the detection
  /// callback, the threads are joined later by the next start_session,
  /// stop_session or the destructor. NotRunning if no session is running.
  std::expected<lootwatch::core::SessionStats, lootwatch::core::LootError> stop_session();

  void on_detection(DetectionCallback callback);

  /// InvalidConfig outside 16..5000 ms or, once configured, shorter than the
  /// session's dedup.burst_window. A running producer uses the new period from
  /// its next tick.
  std::expected<void, lootwatch::core::LootError>
  update_capture_interval(std::chrono::milliseconds interval);

  [[nodiscard]] bool is_running() const noexcept { return running_.load(); }
  [[nodiscard]] lootwatch::core::SessionStats stats() const;
  [[nodiscard]] std::vector<DetectionRecord> recent_detections() const;
  [[nodiscard]] SchedulerStatus status() const;

  /// Ledger summary of the current (or last) session; nullopt before the first start.
  [[nodiscard]] std::optional<lootwatch::core::SessionSummary> session_summary() const;

 private:
  struct Tick {
    std::chrono::steady_clock::time_point scheduled;
    std::chrono::system_clock::time_point wall;
  };

  using OcrResult = std::expected<std::vector<lootwatch::core::OcrReading>,
                                  lootwatch::core::LootError>;

  void producer_loop();
  void worker_loop();
  void process_tick(const Tick& tick);
  std::optional<OcrResult> run_ocr(lootwatch::core::Frame frame);
  void finish_tick(lootwatch::core::TickOutcome outcome,
                   std::chrono::steady_clock::time_point started,
                   const Tick& tick);

  void signal_stop();
  void join_threads();
  void abandon_pending_ocr();
  lootwatch::core::SessionStats close_session();

  std::shared_ptr<lootwatch::vision::IScreenCapture> capture_;
  std::shared_ptr<lootwatch::vision::IOcrEngine> ocr_;

  std::atomic<bool> running_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<std::int64_t> interval_ms_{250};

  // Held for the whole of start_session and stop_session (except a stop
  // requested from the worker itself).
  std::mutex lifecycle_mutex_;
  std::atomic<std::thread::id> worker_id_{};

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::unique_ptr<lootwatch::core::BoundedQueue<Tick>> queue_;
  std::thread producer_;
  std::thread worker_;

  // Touched by the worker only while running.
  std::optional<std::uint64_t> last_hash_;
  std::future<OcrResult> pending_ocr_;
  SessionLog session_log_;
  std::chrono::steady_clock::time_point session_origin_;

  mutable std::mutex config_mutex_;
  std::optional<ScheduleConfig> config_;

  mutable std::mutex pipeline_mutex_;
  std::unique_ptr<lootwatch::core::LootPipeline> pipeline_;

  mutable std::mutex stats_mutex_;
  lootwatch::core::StatsTracker stats_;
  std::deque<DetectionRecord> recent_;

  mutable std::mutex callback_mutex_;
  DetectionCallback callback_;
};

}  // namespace lootwatch::app
