#pragma once

#include <vector>

namespace lse {

  // Tightly packed RGBA8 pixels, rows top to bottom.
  struct ImageData {
    int width{0};
    int height{0};
    int channels{0};
    std::vector<unsigned char> pixels{};
  };

} // namespace lse
