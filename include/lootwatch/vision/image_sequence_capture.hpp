#pragma once

#include <lootwatch/vision/screen_capture.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace lootwatch::vision {

/// Replays recorded screenshots: each call loads the next image of a directory
/// (sorted by file name, wrapping around) and crops it to the region.
/// Lets a session run headless against captured traces.
class ImageSequenceCapture : public IScreenCapture {
 public:
  /// Collects .png/.jpg/.jpeg/.bmp files of `directory`. Throws
  /// std::runtime_error if the directory has no images.
  explicit ImageSequenceCapture(const std::filesystem::path& directory);

  [[nodiscard]] std::expected<lootwatch::core::Frame, lootwatch::core::LootError>
  capture_region(const lootwatch::core::Region& region) override;

  [[nodiscard]] std::size_t image_count() const noexcept { return files_.size(); }

 private:
  std::vector<std::filesystem::path> files_;
  std::size_t next_{0};
};

}  // namespace lootwatch::vision
