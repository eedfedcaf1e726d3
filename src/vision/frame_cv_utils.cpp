#include "frame_cv_utils.hpp"
#include <lootwatch/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace lootwatch::vision::detail {

namespace lc = lootwatch::core;

std::optional<cv::Mat> frame_to_mat(const lc::Frame& frame) {
  if (!frame.well_formed()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.stride();
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case lc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case lc::PixelFormat::RGB8:
    case lc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case lc::PixelFormat::RGBA8:
    case lc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case lc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

lc::Frame mat_to_frame(const cv::Mat& mat, lc::PixelFormat format) {
  if (mat.empty()) return lc::Frame();

  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const auto w = static_cast<std::uint32_t>(packed.cols);
  const auto h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return lc::Frame(w, h, format, std::move(buffer));
}

cv::Mat frame_to_bgr(const lc::Frame& frame) {
  auto view = frame_to_mat(frame);
  if (!view) return {};

  cv::Mat bgr;
  switch (frame.format()) {
    case lc::PixelFormat::Grayscale8:
      cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
      break;
    case lc::PixelFormat::RGB8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGB2BGR);
      break;
    case lc::PixelFormat::RGBA8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGBA2BGR);
      break;
    case lc::PixelFormat::BGRA8:
      cv::cvtColor(*view, bgr, cv::COLOR_BGRA2BGR);
      break;
    default:
      bgr = view->clone();
      break;
  }
  return bgr;
}

std::optional<cv::Rect> clip_region(const lc::Region& region,
                                    int image_width,
                                    int image_height) {
  const cv::Rect wanted(region.x, region.y, region.width, region.height);
  const cv::Rect clipped = wanted & cv::Rect(0, 0, image_width, image_height);
  if (clipped.empty()) return std::nullopt;
  return clipped;
}

}  // namespace lootwatch::vision::detail
