#include "Engine/IO/image_io.hpp"

// libs
#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

// std
#include <algorithm>
#include <cstddef>
#include <utility>

namespace lse {

  namespace {
    constexpr int kRgbaChannels = 4;

    void setError(std::string *outError, const std::string &message) {
      if (outError) {
        *outError = message.empty() ? "unknown error" : message;
      }
    }

    void takeStbPixels(stbi_uc *pixels, int width, int height, ImageData &outData) {
      const std::size_t pixelCount = static_cast<std::size_t>(width) * height;
      outData.width = width;
      outData.height = height;
      outData.channels = kRgbaChannels;
      outData.pixels.assign(pixels, pixels + pixelCount * kRgbaChannels);
      stbi_image_free(pixels);
    }
  } // namespace

  bool loadImageDataFromFile(
    const std::string &path,
    ImageData &outData,
    std::string *outError) {
    outData = ImageData{};
    if (path.empty()) {
      setError(outError, "empty image path");
      return false;
    }

    // regions are addressed from the top-left, so rows stay in file order
    stbi_set_flip_vertically_on_load(0);
    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc *pixels = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb_alpha);
    if (!pixels) {
      const char *reason = stbi_failure_reason();
      setError(outError, reason ? reason : "");
      return false;
    }

    takeStbPixels(pixels, width, height, outData);
    return true;
  }

  bool loadImageDataFromRgba(
    const unsigned char *rgbaPixels,
    int width,
    int height,
    ImageData &outData,
    std::string *outError) {
    outData = ImageData{};
    if (!rgbaPixels || width <= 0 || height <= 0) {
      setError(outError, "invalid RGBA pixel data");
      return false;
    }

    const std::size_t pixelCount = static_cast<std::size_t>(width) * height;
    outData.width = width;
    outData.height = height;
    outData.channels = kRgbaChannels;
    outData.pixels.assign(rgbaPixels, rgbaPixels + pixelCount * kRgbaChannels);
    return true;
  }

  bool cropImageData(
    const ImageData &source,
    int x,
    int y,
    int width,
    int height,
    ImageData &outData,
    std::string *outError) {
    if (width <= 0 || height <= 0) {
      setError(outError, "crop region is empty");
      return false;
    }
    if (x < 0 || y < 0 || x + width > source.width || y + height > source.height) {
      setError(
        outError,
        "crop region " + std::to_string(x) + "," + std::to_string(y) + " " +
          std::to_string(width) + "x" + std::to_string(height) + " exceeds image " +
          std::to_string(source.width) + "x" + std::to_string(source.height));
      return false;
    }

    ImageData cropped{};
    cropped.width = width;
    cropped.height = height;
    cropped.channels = kRgbaChannels;
    cropped.pixels.resize(static_cast<std::size_t>(width) * height * kRgbaChannels);

    const std::size_t srcStride = static_cast<std::size_t>(source.width) * kRgbaChannels;
    const std::size_t rowBytes = static_cast<std::size_t>(width) * kRgbaChannels;
    for (int row = 0; row < height; ++row) {
      const auto srcBegin = source.pixels.begin() +
        static_cast<std::ptrdiff_t>((y + row) * srcStride + static_cast<std::size_t>(x) * kRgbaChannels);
      std::copy(
        srcBegin,
        srcBegin + static_cast<std::ptrdiff_t>(rowBytes),
        cropped.pixels.begin() + static_cast<std::ptrdiff_t>(row * rowBytes));
    }

    outData = std::move(cropped);
    return true;
  }

} // namespace lse
