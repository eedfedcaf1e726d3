#pragma once

#include <lootwatch/vision/screen_capture.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace lootwatch::vision {

/// Scripted capture source (for tests/demo).
/// Returns queued responses in order; once the script is exhausted, the
/// default frame (or CaptureFailed if none) is returned on every call.
class MockScreenCapture : public IScreenCapture {
 public:
  using Response = std::expected<lootwatch::core::Frame, lootwatch::core::LootError>;

  void set_default_frame(lootwatch::core::Frame frame);
  void push_response(Response response);

  [[nodiscard]] Response capture_region(const lootwatch::core::Region& region) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }
  [[nodiscard]] std::optional<lootwatch::core::Region> last_region() const;

 private:
  mutable std::mutex mutex_;
  std::deque<Response> script_;
  std::optional<lootwatch::core::Frame> default_frame_;
  std::optional<lootwatch::core::Region> last_region_;
  std::atomic<std::size_t> calls_{0};
};

/// Solid-color BGR8 frame of the given size; `shade` distinguishes frames.
[[nodiscard]] lootwatch::core::Frame make_solid_frame(std::uint32_t width,
                                                      std::uint32_t height,
                                                      std::uint8_t shade);

}  // namespace lootwatch::vision
