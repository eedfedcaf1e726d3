#pragma once

#include <lootwatch/core/frame.hpp>
#include <lootwatch/core/region.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace lootwatch::vision::detail {

/// Wrap a Frame as a cv::Mat view (no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const lootwatch::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
lootwatch::core::Frame mat_to_frame(const cv::Mat& mat,
                                     lootwatch::core::PixelFormat format);

/// 3-channel BGR copy of a Frame, whatever its channel order. Empty Mat if unsupported.
cv::Mat frame_to_bgr(const lootwatch::core::Frame& frame);

/// Intersection of `region` with an image of the given size; nullopt if empty.
std::optional<cv::Rect> clip_region(const lootwatch::core::Region& region,
                                    int image_width,
                                    int image_height);

}  // namespace lootwatch::vision::detail
