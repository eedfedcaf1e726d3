#include <lootwatch/vision/mock_ocr_engine.hpp>
#include <thread>

namespace lootwatch::vision {

namespace lc = lootwatch::core;

void MockOcrEngine::set_readings(std::vector<lc::OcrReading> readings) {
  std::lock_guard lock(mutex_);
  readings_ = std::move(readings);
}

void MockOcrEngine::push_response(Response response) {
  std::lock_guard lock(mutex_);
  script_.push_back(std::move(response));
}

void MockOcrEngine::set_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  delay_ = delay;
}

MockOcrEngine::Response MockOcrEngine::recognize(const lc::Frame& input) {
  ++calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::chrono::milliseconds delay{0};
  Response response;
  {
    std::lock_guard lock(mutex_);
    delay = delay_;
    if (!script_.empty()) {
      response = std::move(script_.front());
      script_.pop_front();
    } else {
      response = readings_;
    }
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }
  return response;
}

}  // namespace lootwatch::vision
