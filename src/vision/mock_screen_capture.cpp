#include <lootwatch/vision/mock_screen_capture.hpp>
#include <vector>

namespace lootwatch::vision {

namespace lc = lootwatch::core;

void MockScreenCapture::set_default_frame(lc::Frame frame) {
  std::lock_guard lock(mutex_);
  default_frame_ = std::move(frame);
}

void MockScreenCapture::push_response(Response response) {
  std::lock_guard lock(mutex_);
  script_.push_back(std::move(response));
}

MockScreenCapture::Response MockScreenCapture::capture_region(const lc::Region& region) {
  ++calls_;
  std::lock_guard lock(mutex_);
  last_region_ = region;
  if (!script_.empty()) {
    Response next = std::move(script_.front());
    script_.pop_front();
    return next;
  }
  if (!default_frame_) {
    return std::unexpected(lc::LootError::CaptureFailed);
  }
  return *default_frame_;
}

std::optional<lc::Region> MockScreenCapture::last_region() const {
  std::lock_guard lock(mutex_);
  return last_region_;
}

lc::Frame make_solid_frame(std::uint32_t width, std::uint32_t height, std::uint8_t shade) {
  std::vector<std::byte> buffer(lc::Frame::min_bytes(width, height, lc::PixelFormat::BGR8),
                                static_cast<std::byte>(shade));
  return lc::Frame(width, height, lc::PixelFormat::BGR8, std::move(buffer));
}

}  // namespace lootwatch::vision
