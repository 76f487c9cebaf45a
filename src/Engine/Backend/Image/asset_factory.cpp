#include "Engine/Backend/Image/asset_factory.hpp"

#include "Engine/Backend/Image/image_texture.hpp"
#include "Engine/IO/image_io.hpp"
#include "Engine/sprite_errors.hpp"

// std
#include <fstream>
#include <memory>
#include <utility>

namespace lse::backend {

  namespace {
    bool isReadable(const std::string &path) {
      std::ifstream file(path, std::ios::in | std::ios::binary);
      return static_cast<bool>(file);
    }
  } // namespace

  RenderTexturePtr ImageRenderAssetFactory::loadTexture(const std::string &path, const TextureRegion &region) {
    const CacheKey key{path, region.x, region.y, region.width, region.height};
    auto it = textureCache.find(key);
    if (it != textureCache.end()) {
      return it->second;
    }

    if (path.empty() || !isReadable(path)) {
      throw TextureLoadError("cannot open texture file: " + path);
    }

    ImageData image{};
    std::string error;
    if (!loadImageDataFromFile(path, image, &error)) {
      throw TextureDecodeError("failed to decode texture " + path + ": " + error);
    }

    if (!region.isWholeImage()) {
      ImageData cropped{};
      if (!cropImageData(image, region.x, region.y, region.width, region.height, cropped, &error)) {
        throw TextureDecodeError("bad region for texture " + path + ": " + error);
      }
      image = std::move(cropped);
    }

    auto texture = std::make_shared<ImageTexture>(std::move(image));
    textureCache.emplace(key, texture);
    return texture;
  }

} // namespace lse::backend
