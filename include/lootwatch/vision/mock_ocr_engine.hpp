#pragma once

#include <lootwatch/vision/ocr_engine.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>

namespace lootwatch::vision {

/// Engine that returns configurable readings (for tests/demo).
/// Queued responses are consumed first, then the default readings repeat.
class MockOcrEngine : public IOcrEngine {
 public:
  using Response = std::expected<std::vector<lootwatch::core::OcrReading>,
                                 lootwatch::core::LootError>;

  void set_readings(std::vector<lootwatch::core::OcrReading> readings);
  void push_response(Response response);

  /// Every recognize() sleeps this long first (simulates a slow backend).
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] Response recognize(const lootwatch::core::Frame& input) override;

  [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  mutable std::mutex mutex_;
  std::vector<lootwatch::core::OcrReading> readings_;
  std::deque<Response> script_;
  std::chrono::milliseconds delay_{0};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace lootwatch::vision
