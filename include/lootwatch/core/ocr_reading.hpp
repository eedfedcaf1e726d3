#pragma once

#include <array>
#include <chrono>
#include <string>

namespace lootwatch::core {

/// Timestamps inside a session: milliseconds on a monotonic clock.
using Millis = std::chrono::milliseconds;

struct Point {
  float x{0.f};
  float y{0.f};
};

/// Four-point bounding polygon, clockwise from top-left as the OCR engine reports it.
using Quad = std::array<Point, 4>;

/// Axis-aligned quad from a rectangle.
[[nodiscard]] Quad make_quad(float x, float y, float w, float h) noexcept;

/// One recognized text fragment of one capture.
struct OcrReading {
  std::string text;
  float confidence{0.f};  // 0..1
  Quad bbox{};
  Millis timestamp{0};

  /// Smallest y of the bounding polygon, relative to the capture region.
  [[nodiscard]] float top() const noexcept;
};

}  // namespace lootwatch::core
