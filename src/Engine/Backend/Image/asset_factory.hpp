#pragma once

#include "Engine/Backend/render_assets.hpp"

// std
#include <cstddef>
#include <map>
#include <string>
#include <tuple>

namespace lse::backend {

  /*
   * Loads textures with stb_image. Identical (path, region) requests share one
   * texture. The cache keeps every texture it has handed out alive and never
   * evicts on its own; call clearCache() to drop it (textures still referenced
   * by sprites stay valid).
   */
  class ImageRenderAssetFactory final : public RenderAssetFactory {
  public:
    RenderTexturePtr loadTexture(const std::string &path, const TextureRegion &region = {}) override;

    std::size_t getCachedTextureCount() const { return textureCache.size(); }
    void clearCache() { textureCache.clear(); }

  private:
    using CacheKey = std::tuple<std::string, int, int, int, int>;

    std::map<CacheKey, RenderTexturePtr> textureCache;
  };

} // namespace lse::backend
