#pragma once

#include "Engine/Backend/render_assets.hpp"
#include "Engine/IO/image_data.hpp"

// std
#include <utility>

namespace lse::backend {

  // CPU-side texture: keeps the decoded pixels of one image region.
  class ImageTexture final : public RenderTexture {
  public:
    explicit ImageTexture(ImageData image) : image{std::move(image)} {}

    ImageTexture(const ImageTexture &) = delete;
    ImageTexture &operator=(const ImageTexture &) = delete;

    int getWidth() const override { return image.width; }
    int getHeight() const override { return image.height; }
    const ImageData &getImage() const { return image; }

  private:
    ImageData image;
  };

} // namespace lse::backend
