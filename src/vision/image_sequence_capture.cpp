#include <lootwatch/vision/image_sequence_capture.hpp>
#include <lootwatch/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lootwatch::vision {

namespace lc = lootwatch::core;
namespace fs = std::filesystem;

namespace {

bool is_image_file(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp";
}

}  // namespace

ImageSequenceCapture::ImageSequenceCapture(const fs::path& directory) {
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    if (entry.is_regular_file() && is_image_file(entry.path())) {
      files_.push_back(entry.path());
    }
  }
  if (ec) {
    throw std::runtime_error("ImageSequenceCapture: cannot list " + directory.string() +
                             ": " + ec.message());
  }
  if (files_.empty()) {
    throw std::runtime_error("ImageSequenceCapture: no images in " + directory.string());
  }
  std::sort(files_.begin(), files_.end());
  CV_LOG_INFO(NULL, "lootwatch: replaying " << files_.size() << " images from "
                                            << directory.string());
}

std::expected<lc::Frame, lc::LootError>
ImageSequenceCapture::capture_region(const lc::Region& region) {
  const fs::path& path = files_[next_];
  next_ = (next_ + 1) % files_.size();

  auto screen = load_frame_from_image(path.string());
  if (!screen) {
    return std::unexpected(lc::LootError::CaptureFailed);
  }
  auto mat = detail::frame_to_mat(*screen);
  if (!mat) {
    return std::unexpected(lc::LootError::CaptureFailed);
  }
  auto rect = detail::clip_region(region, mat->cols, mat->rows);
  if (!rect) {
    CV_LOG_WARNING(NULL, "lootwatch: region outside " << path.string());
    return std::unexpected(lc::LootError::CaptureFailed);
  }
  return detail::mat_to_frame((*mat)(*rect), screen->format());
}

}  // namespace lootwatch::vision
