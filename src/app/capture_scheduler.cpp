#include <lootwatch/app/capture_scheduler.hpp>
#include <lootwatch/app/config.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <exception>
#include <utility>

namespace lootwatch::app {

namespace lc = lootwatch::core;

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point since) {
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - since);
  return 1e-3 * static_cast<double>(us.count());
}

}  // namespace

CaptureScheduler::CaptureScheduler(std::shared_ptr<lootwatch::vision::IScreenCapture> capture,
                                   std::shared_ptr<lootwatch::vision::IOcrEngine> ocr)
    : capture_(std::move(capture)), ocr_(std::move(ocr)) {}

CaptureScheduler::~CaptureScheduler() {
  if (running_.load()) {
    auto stopped = stop_session();
    if (!stopped) {
      CV_LOG_WARNING(NULL, "scheduler: stop on destruction failed: "
                               << lc::to_string(stopped.error()));
    }
  }
  std::lock_guard lifecycle(lifecycle_mutex_);
  join_threads();
}

std::expected<void, lc::LootError> CaptureScheduler::start_session(ScheduleConfig config) {
  // From a detection callback the worker of the current session is still alive.
  if (std::this_thread::get_id() == worker_id_.load()) {
    return std::unexpected(lc::LootError::AlreadyRunning);
  }
  std::lock_guard lifecycle(lifecycle_mutex_);
  if (running_.load()) {
    return std::unexpected(lc::LootError::AlreadyRunning);
  }
  // The previous session may have been stopped from its own detection callback.
  join_threads();
  auto region = lc::normalize_region(config.region);
  if (!region) {
    CV_LOG_WARNING(NULL, "scheduler: rejected region " << config.region.width << "x"
                             << config.region.height);
    return std::unexpected(region.error());
  }
  if (!valid_capture_interval(config.interval)) {
    return std::unexpected(lc::LootError::InvalidConfig);
  }
  if (!interval_fits_dedup(config.interval, config.dedup)) {
    CV_LOG_WARNING(NULL, "scheduler: interval " << config.interval.count()
                             << "ms is shorter than the burst window of "
                             << config.dedup.burst_window.count() << "ms");
    return std::unexpected(lc::LootError::InvalidConfig);
  }
  if (config.location.empty()) {
    return std::unexpected(lc::LootError::NoLocation);
  }
  config.region = *region;

  auto pipeline = std::make_unique<lc::LootPipeline>(config.dedup, config.region.height,
                                                     config.matcher);
  if (config.catalog || !config.catalog_provider) {
    pipeline->ledger().set_location(config.location, config.catalog);
  } else {
    auto loaded = pipeline->ledger().set_location(config.location, *config.catalog_provider);
    if (!loaded) {
      CV_LOG_WARNING(NULL, "scheduler: continuing without a catalog for \""
                               << config.location << "\"");
    }
  }
  auto started = pipeline->ledger().start();
  if (!started) {
    return std::unexpected(started.error());
  }

  const auto wall_start = std::chrono::system_clock::now();
  {
    std::lock_guard lock(pipeline_mutex_);
    pipeline_ = std::move(pipeline);
  }
  {
    std::lock_guard lock(stats_mutex_);
    stats_.reset(wall_start);
    recent_.clear();
  }
  last_hash_.reset();
  session_origin_ = std::chrono::steady_clock::now();
  if (!config.session_log_path.empty() &&
      !session_log_.open(config.session_log_path, wall_start, config.region, config.interval)) {
    CV_LOG_WARNING(NULL, "scheduler: running without a session log");
  }

  interval_ms_.store(config.interval.count());
  queue_ = std::make_unique<lc::BoundedQueue<Tick>>(config.queue_capacity);

  CV_LOG_INFO(NULL, "scheduler: session started at \"" << config.location << "\", region "
                        << config.region.x << "," << config.region.y << " "
                        << config.region.width << "x" << config.region.height << ", every "
                        << config.interval.count() << "ms");
  {
    std::lock_guard lock(config_mutex_);
    config_ = std::move(config);
  }

  stopping_.store(false);
  running_.store(true);
  worker_ = std::thread(&CaptureScheduler::worker_loop, this);
  producer_ = std::thread(&CaptureScheduler::producer_loop, this);
  return {};
}

std::expected<lc::SessionStats, lc::LootError> CaptureScheduler::stop_session() {
  if (std::this_thread::get_id() == worker_id_.load()) {
    // Detection callback: the worker cannot join itself. It leaves its loop once
    // the callback returns and is joined by whoever takes the lifecycle next.
    if (!running_.exchange(false)) {
      return std::unexpected(lc::LootError::NotRunning);
    }
    signal_stop();
    return close_session();
  }

  std::lock_guard lifecycle(lifecycle_mutex_);
  if (!running_.exchange(false)) {
    join_threads();
    return std::unexpected(lc::LootError::NotRunning);
  }
  signal_stop();
  join_threads();
  return close_session();
}

void CaptureScheduler::signal_stop() {
  {
    std::lock_guard lock(stop_mutex_);
    stopping_.store(true);
  }
  stop_cv_.notify_all();
  queue_->close();
}

void CaptureScheduler::join_threads() {
  if (producer_.joinable()) producer_.join();
  if (worker_.joinable()) worker_.join();
  worker_id_.store(std::thread::id{});
}

void CaptureScheduler::abandon_pending_ocr() {
  if (!pending_ocr_.valid()) return;
  if (pending_ocr_.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready) {
    pending_ocr_ = {};
    return;
  }
  // The engine may never return; the call keeps its own reference to it.
  CV_LOG_WARNING(NULL, "scheduler: abandoning an OCR call still in flight");
  std::thread([abandoned = std::move(pending_ocr_)]() mutable { abandoned.wait(); }).detach();
}

lc::SessionStats CaptureScheduler::close_session() {
  const std::size_t discarded = queue_->clear();
  abandon_pending_ocr();

  {
    std::lock_guard lock(pipeline_mutex_);
    auto ended = pipeline_->ledger().end();
    if (!ended) {
      CV_LOG_WARNING(NULL, "scheduler: ledger already closed: " << lc::to_string(ended.error()));
    }
  }

  const lc::SessionStats final_stats = stats();
  session_log_.close(std::chrono::system_clock::now(), final_stats);
  CV_LOG_INFO(NULL, "scheduler: session stopped; attempts=" << final_stats.captures_attempted
                        << " succeeded=" << final_stats.captures_succeeded
                        << " skipped=" << final_stats.captures_skipped
                        << " failed=" << final_stats.captures_failed
                        << " dropped=" << final_stats.ticks_dropped
                        << " items=" << final_stats.items_detected
                        << " discarded=" << discarded);
  return final_stats;
}

void CaptureScheduler::on_detection(DetectionCallback callback) {
  std::lock_guard lock(callback_mutex_);
  callback_ = std::move(callback);
}

std::expected<void, lc::LootError>
CaptureScheduler::update_capture_interval(std::chrono::milliseconds interval) {
  if (!valid_capture_interval(interval)) {
    return std::unexpected(lc::LootError::InvalidConfig);
  }
  {
    std::lock_guard lock(config_mutex_);
    if (config_) {
      if (!interval_fits_dedup(interval, config_->dedup)) {
        return std::unexpected(lc::LootError::InvalidConfig);
      }
      config_->interval = interval;
    }
    interval_ms_.store(interval.count());
  }
  CV_LOG_INFO(NULL, "scheduler: capture interval set to " << interval.count() << "ms");
  return {};
}

lc::SessionStats CaptureScheduler::stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_.stats();
}

std::vector<DetectionRecord> CaptureScheduler::recent_detections() const {
  std::lock_guard lock(stats_mutex_);
  return {recent_.begin(), recent_.end()};
}

SchedulerStatus CaptureScheduler::status() const {
  SchedulerStatus s;
  s.running = running_.load();
  s.stats = stats();
  std::lock_guard lock(config_mutex_);
  s.config = config_;
  return s;
}

std::optional<lc::SessionSummary> CaptureScheduler::session_summary() const {
  std::lock_guard lock(pipeline_mutex_);
  if (!pipeline_) return std::nullopt;
  return pipeline_->ledger().summary();
}

void CaptureScheduler::producer_loop() {
  std::unique_lock lock(stop_mutex_);
  while (!stopping_.load()) {
    const Tick tick{std::chrono::steady_clock::now(), std::chrono::system_clock::now()};
    if (!queue_->try_push(tick)) {
      std::lock_guard stats_lock(stats_mutex_);
      stats_.record_dropped_tick();
    }
    const auto period = std::chrono::milliseconds(interval_ms_.load());
    stop_cv_.wait_for(lock, period, [this]() { return stopping_.load(); });
  }
}

void CaptureScheduler::worker_loop() {
  worker_id_.store(std::this_thread::get_id());
  while (auto tick = queue_->pop()) {
    if (stopping_.load()) break;
    process_tick(*tick);
  }
}

void CaptureScheduler::finish_tick(lc::TickOutcome outcome,
                                   std::chrono::steady_clock::time_point started,
                                   const Tick& tick) {
  std::lock_guard lock(stats_mutex_);
  stats_.record_tick(outcome, elapsed_ms(started), tick.wall);
}

std::optional<CaptureScheduler::OcrResult> CaptureScheduler::run_ocr(lc::Frame frame) {
  std::chrono::milliseconds timeout{2000};
  {
    std::lock_guard lock(config_mutex_);
    if (config_) timeout = config_->ocr_timeout;
  }

  // The engine handles one call at a time; give a hung previous call one more
  // timeout before failing this tick too.
  if (pending_ocr_.valid()) {
    if (pending_ocr_.wait_for(timeout) != std::future_status::ready) {
      return std::nullopt;
    }
    pending_ocr_ = {};
  }

  pending_ocr_ = std::async(std::launch::async,
                            [engine = ocr_, frame = std::move(frame)]() -> OcrResult {
                              try {
                                return engine->recognize(frame);
                              } catch (const std::exception& e) {
                                CV_LOG_WARNING(NULL, "scheduler: OCR threw: " << e.what());
                                return std::unexpected(lc::LootError::OcrFailed);
                              }
                            });
  if (pending_ocr_.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return pending_ocr_.get();
}

void CaptureScheduler::process_tick(const Tick& tick) {
  const auto started = std::chrono::steady_clock::now();

  lc::Region region;
  {
    std::lock_guard lock(config_mutex_);
    region = config_->region;
  }

  std::expected<lc::Frame, lc::LootError> frame = std::unexpected(lc::LootError::CaptureFailed);
  try {
    frame = capture_->capture_region(region);
  } catch (const std::exception& e) {
    CV_LOG_WARNING(NULL, "scheduler: capture threw: " << e.what());
  }
  if (!frame) {
    CV_LOG_WARNING(NULL, "scheduler: capture failed: " << lc::to_string(frame.error()));
    finish_tick(lc::TickOutcome::Failed, started, tick);
    return;
  }

  const std::uint64_t hash = frame->content_hash();
  if (last_hash_ && *last_hash_ == hash) {
    finish_tick(lc::TickOutcome::Skipped, started, tick);
    return;
  }

  auto readings = run_ocr(std::move(*frame));
  if (!readings) {
    CV_LOG_WARNING(NULL, "scheduler: OCR timed out");
    finish_tick(lc::TickOutcome::TimedOut, started, tick);
    return;
  }
  if (!*readings) {
    CV_LOG_WARNING(NULL, "scheduler: OCR failed: " << lc::to_string(readings->error()));
    finish_tick(lc::TickOutcome::Failed, started, tick);
    return;
  }
  if (stopping_.load()) return;
  last_hash_ = hash;

  const auto at = std::chrono::duration_cast<lc::Millis>(tick.scheduled - session_origin_);
  std::vector<DetectionRecord> emitted;
  std::string location;
  {
    std::lock_guard lock(pipeline_mutex_);
    location = pipeline_->ledger().session().location.value_or("");
    for (auto& reading : **readings) {
      reading.timestamp = at;
      auto match = pipeline_->process(reading);
      if (!match) continue;

      DetectionRecord record;
      record.timestamp = tick.wall;
      record.item = match->item;
      record.quantity = match->quantity;
      record.location = location;
      record.confidence = match->confidence;
      record.method = match->method;
      record.original_text = match->original_text;
      record.bbox = match->bbox;
      record.processing_ms = elapsed_ms(started);
      session_log_.detection(tick.wall, *match, record.processing_ms);
      CV_LOG_INFO(NULL, "scheduler: [" << lc::to_string(match->method) << "] " << match->item
                            << " x" << match->quantity << " (" << match->confidence << ")");
      emitted.push_back(std::move(record));
    }
  }

  {
    std::lock_guard lock(stats_mutex_);
    for (const auto& record : emitted) {
      stats_.record_detection();
      recent_.push_back(record);
      if (recent_.size() > kMaxRecentDetections) recent_.pop_front();
    }
    stats_.record_tick(lc::TickOutcome::Succeeded, elapsed_ms(started), tick.wall);
  }

  if (emitted.empty()) return;
  DetectionCallback callback;
  {
    std::lock_guard lock(callback_mutex_);
    callback = callback_;
  }
  if (callback) {
    for (const auto& record : emitted) callback(record);
  }
}

}  // namespace lootwatch::app
