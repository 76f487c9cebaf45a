#pragma once

// std
#include <memory>
#include <string>

namespace lse::backend {

  // Pixel sub-region of an image. All zero selects the whole image.
  struct TextureRegion {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    bool isWholeImage() const { return x == 0 && y == 0 && width == 0 && height == 0; }
  };

  class RenderTexture {
  public:
    virtual ~RenderTexture() = default;

    virtual int getWidth() const = 0;
    virtual int getHeight() const = 0;
  };

  using RenderTexturePtr = std::shared_ptr<RenderTexture>;

  class RenderAssetFactory {
  public:
    virtual ~RenderAssetFactory() = default;

    // Throws TextureLoadError when the file is unreadable and TextureDecodeError
    // when it cannot be decoded or the region does not fit the image.
    virtual RenderTexturePtr loadTexture(const std::string &path, const TextureRegion &region = {}) = 0;
  };

} // namespace lse::backend
