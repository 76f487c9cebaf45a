#pragma once

#include "Engine/IO/image_data.hpp"

// std
#include <string>

namespace lse {

  bool loadImageDataFromFile(
    const std::string &path,
    ImageData &outData,
    std::string *outError = nullptr);

  bool loadImageDataFromRgba(
    const unsigned char *rgbaPixels,
    int width,
    int height,
    ImageData &outData,
    std::string *outError = nullptr);

  // Copies the width x height block at (x, y) of source into outData.
  // Fails when the block is empty or does not lie entirely inside source.
  bool cropImageData(
    const ImageData &source,
    int x,
    int y,
    int width,
    int height,
    ImageData &outData,
    std::string *outError = nullptr);

} // namespace lse
