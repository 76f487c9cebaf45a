#include "Engine/IO/image_io.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace lse {
  namespace {
    // 4x3 image where every pixel's red channel is its index
    ImageData makeIndexedImage() {
      std::vector<unsigned char> rgba(4 * 3 * 4, 255);
      for (int i = 0; i < 12; ++i) {
        rgba[static_cast<std::size_t>(i) * 4] = static_cast<unsigned char>(i);
      }
      ImageData image{};
      EXPECT_TRUE(loadImageDataFromRgba(rgba.data(), 4, 3, image));
      return image;
    }
  } // namespace

  TEST(ImageIoTest, RgbaCopiesPixels) {
    const ImageData image = makeIndexedImage();
    EXPECT_EQ(image.width, 4);
    EXPECT_EQ(image.height, 3);
    EXPECT_EQ(image.channels, 4);
    ASSERT_EQ(image.pixels.size(), 48u);
    EXPECT_EQ(image.pixels[4 * 5], 5);
  }

  TEST(ImageIoTest, RgbaRejectsBadInput) {
    ImageData image{};
    std::string error;
    EXPECT_FALSE(loadImageDataFromRgba(nullptr, 4, 4, image, &error));
    EXPECT_FALSE(error.empty());
    const unsigned char pixel[4] = {0, 0, 0, 0};
    EXPECT_FALSE(loadImageDataFromRgba(pixel, 0, 1, image));
  }

  TEST(ImageIoTest, CropCopiesBlock) {
    const ImageData image = makeIndexedImage();
    ImageData cropped{};

    ASSERT_TRUE(cropImageData(image, 1, 1, 2, 2, cropped));

    EXPECT_EQ(cropped.width, 2);
    EXPECT_EQ(cropped.height, 2);
    ASSERT_EQ(cropped.pixels.size(), 16u);
    EXPECT_EQ(cropped.pixels[0], 5);
    EXPECT_EQ(cropped.pixels[4], 6);
    EXPECT_EQ(cropped.pixels[8], 9);
    EXPECT_EQ(cropped.pixels[12], 10);
  }

  TEST(ImageIoTest, CropRejectsRegionsOutsideImage) {
    const ImageData image = makeIndexedImage();
    ImageData cropped{};
    std::string error;

    EXPECT_FALSE(cropImageData(image, 3, 0, 2, 1, cropped, &error));
    EXPECT_NE(error.find("exceeds"), std::string::npos);
    EXPECT_FALSE(cropImageData(image, -1, 0, 1, 1, cropped));
    EXPECT_FALSE(cropImageData(image, 0, 0, 0, 1, cropped));
  }

  TEST(ImageIoTest, FileLoadReportsMissingFile) {
    ImageData image{};
    std::string error;
    EXPECT_FALSE(loadImageDataFromFile("definitely/not/here.png", image, &error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(loadImageDataFromFile("", image));
  }

} // namespace lse
