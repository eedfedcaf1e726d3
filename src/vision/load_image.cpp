#include <lootwatch/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <lootwatch/core/frame.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>

namespace lootwatch::vision {

std::optional<lootwatch::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) {
    CV_LOG_WARNING(NULL, "lootwatch: cannot read image " << path);
    return std::nullopt;
  }

  lootwatch::core::PixelFormat format = lootwatch::core::PixelFormat::BGR8;
  if (mat.channels() == 1) {
    format = lootwatch::core::PixelFormat::Grayscale8;
  } else if (mat.channels() == 4) {
    format = lootwatch::core::PixelFormat::BGRA8;
  }
  if (mat.depth() != CV_8U) {
    mat.convertTo(mat, CV_8U, 1.0 / 256.0);
  }

  return detail::mat_to_frame(mat, format);
}

}  // namespace lootwatch::vision
