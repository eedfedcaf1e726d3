#include <lootwatch/core/ocr_reading.hpp>
#include <algorithm>

namespace lootwatch::core {

Quad make_quad(float x, float y, float w, float h) noexcept {
  return Quad{Point{x, y}, Point{x + w, y}, Point{x + w, y + h}, Point{x, y + h}};
}

float OcrReading::top() const noexcept {
  float top = bbox[0].y;
  for (const auto& p : bbox) {
    top = std::min(top, p.y);
  }
  return top;
}

}  // namespace lootwatch::core
