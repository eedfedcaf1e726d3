#include <lootwatch/vision/image_sequence_capture.hpp>
#include <lootwatch/vision/load_image.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace lc = lootwatch::core;
namespace lv = lootwatch::vision;
namespace fs = std::filesystem;

namespace {

class ImageSequenceCaptureTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("lootwatch_images_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
            "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::create_directories(dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  void write_image(const std::string& name, int width, int height, unsigned char shade) {
    const cv::Mat img(height, width, CV_8UC3, cv::Scalar(shade, shade, shade));
    ASSERT_TRUE(cv::imwrite((dir_ / name).string(), img));
  }

  fs::path dir_;
};

}  // namespace

TEST_F(ImageSequenceCaptureTest, ThrowsOnEmptyDirectory) {
  EXPECT_THROW(lv::ImageSequenceCapture capture(dir_), std::runtime_error);
}

TEST_F(ImageSequenceCaptureTest, CropsAndCycles) {
  write_image("b.png", 800, 600, 20);
  write_image("a.png", 800, 600, 10);
  lv::ImageSequenceCapture capture(dir_);
  EXPECT_EQ(capture.image_count(), 2u);

  const lc::Region region{100, 50, 350, 300};
  auto first = capture.capture_region(region);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->width(), 350u);
  EXPECT_EQ(first->height(), 300u);
  EXPECT_EQ(first->data()[0], std::byte{10});

  auto second = capture.capture_region(region);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->data()[0], std::byte{20});

  auto wrapped = capture.capture_region(region);
  ASSERT_TRUE(wrapped.has_value());
  EXPECT_EQ(wrapped->data()[0], std::byte{10});
}

TEST_F(ImageSequenceCaptureTest, ClipsToImageBounds) {
  write_image("shot.png", 400, 400, 30);
  lv::ImageSequenceCapture capture(dir_);
  auto frame = capture.capture_region({200, 200, 350, 300});
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(frame->width(), 200u);
  EXPECT_EQ(frame->height(), 200u);
}

TEST_F(ImageSequenceCaptureTest, RegionOffScreenFails) {
  write_image("shot.png", 400, 400, 30);
  lv::ImageSequenceCapture capture(dir_);
  auto frame = capture.capture_region({1000, 1000, 350, 300});
  ASSERT_FALSE(frame.has_value());
  EXPECT_EQ(frame.error(), lc::LootError::CaptureFailed);
}

TEST_F(ImageSequenceCaptureTest, LoadImageMissingFile) {
  EXPECT_FALSE(lv::load_frame_from_image((dir_ / "missing.png").string()).has_value());
}
