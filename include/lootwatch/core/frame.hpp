#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace lootwatch::core {

/// Channel order of a captured bitmap. Screen grabs are usually BGRA8.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// 0 for Unknown.
[[nodiscard]] constexpr std::size_t bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return 4;
    default:
      return 0;
  }
}

/// Pixels of one screen capture, tightly packed rows, top row first.
///
/// The frame owns its bytes; capture backends move a freshly filled buffer in
/// and the scheduler moves the frame on to the OCR call. It is never shared
/// between threads while mutable.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> pixels)
      : width_(width), height_(height), format_(format), pixels_(std::move(pixels)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  /// Bytes per row.
  [[nodiscard]] std::size_t stride() const noexcept {
    return static_cast<std::size_t>(width_) * bytes_per_pixel(format_);
  }

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return pixels_; }

  /// Pixel row `y`; empty when out of range or the frame is not well formed.
  [[nodiscard]] std::span<const std::byte> row(std::uint32_t y) const noexcept;

  [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return pixels_.size(); }

  /// Known format and enough bytes for width x height.
  [[nodiscard]] bool well_formed() const noexcept;

  /// 64-bit FNV-1a over dimensions, format and pixel bytes. Two captures with
  /// equal hashes are treated as an unchanged screen.
  [[nodiscard]] std::uint64_t content_hash() const noexcept;

  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept {
    return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
  }

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> pixels_;
};

}  // namespace lootwatch::core
