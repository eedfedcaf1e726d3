#include <lootwatch/core/frame.hpp>

namespace lootwatch::core {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

inline std::uint64_t fnv1a(std::uint64_t h, std::uint8_t byte) noexcept {
  return (h ^ byte) * kFnvPrime;
}

inline std::uint64_t fnv1a_u32(std::uint64_t h, std::uint32_t v) noexcept {
  for (int i = 0; i < 4; ++i) {
    h = fnv1a(h, static_cast<std::uint8_t>(v >> (8 * i)));
  }
  return h;
}

}  // namespace

bool Frame::well_formed() const noexcept {
  return format_ != PixelFormat::Unknown && width_ > 0 && height_ > 0 &&
         pixels_.size() >= min_bytes(width_, height_, format_);
}

std::span<const std::byte> Frame::row(std::uint32_t y) const noexcept {
  if (y >= height_ || !well_formed()) return {};
  return std::span<const std::byte>(pixels_).subspan(y * stride(), stride());
}

std::uint64_t Frame::content_hash() const noexcept {
  std::uint64_t h = kFnvOffset;
  h = fnv1a_u32(h, width_);
  h = fnv1a_u32(h, height_);
  h = fnv1a(h, static_cast<std::uint8_t>(format_));
  for (const std::byte b : pixels_) {
    h = fnv1a(h, static_cast<std::uint8_t>(b));
  }
  return h;
}

}  // namespace lootwatch::core
