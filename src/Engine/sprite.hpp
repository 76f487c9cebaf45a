#pragma once

#include "Engine/Backend/render_assets.hpp"
#include "Engine/Backend/render_backend.hpp"

// libs
#include <glm/vec2.hpp>

// std
#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace lse {

  class SpriteList;

  struct SpriteCreateInfo {
    backend::RenderAssetFactory *assets{nullptr};
    std::string filename{}; // empty: start without frames
    float scale{0.f};
    backend::TextureRegion region{};
  };

  struct SpriteBounds {
    float left{0.f};
    float bottom{0.f};
    float right{0.f};
    float top{0.f};
  };

  /*
   * Positioned, rotatable, scalable drawable with an ordered list of texture frames.
   *
   * Bounds are derived from the rotated rectangle on every query and never cached.
   * A sprite tracks every SpriteList it has been appended to (one entry per
   * membership, non-owning) so kill() can take it out of all of them.
   */
  class Sprite : public std::enable_shared_from_this<Sprite> {
  public:
    using Points = std::array<glm::vec2, 4>;

    explicit Sprite(const SpriteCreateInfo &info = {});
    Sprite(backend::RenderTexturePtr initialTexture, float scale);
    virtual ~Sprite() = default;

    Sprite(const Sprite &) = delete;
    Sprite &operator=(const Sprite &) = delete;

    void appendTexture(backend::RenderTexturePtr frame);
    void setTexture(std::size_t frameIndex);
    // Swaps the drawn texture without touching the frame index or size.
    void setActiveTexture(backend::RenderTexturePtr newTexture);
    void setPosition(float x, float y);
    void setScale(float newScale);

    // Corners in order (-w,-h), (+w,-h), (+w,+h), (-w,+h) around center, rotated by angle.
    Points getPoints() const;

    float getBottom() const;
    float getTop() const;
    float getLeft() const;
    float getRight() const;
    SpriteBounds getBounds() const;

    // Edge setters translate the sprite only; size and angle are kept.
    void setBottom(float value);
    void setTop(float value);
    void setLeft(float value);
    void setRight(float value);

    virtual void update();
    void draw(backend::RenderBackend &renderer) const;
    void kill();

    float getWidth() const { return width; }
    float getHeight() const { return height; }
    float getScale() const { return scale; }
    const backend::RenderTexturePtr &getTexture() const { return texture; }
    const std::vector<backend::RenderTexturePtr> &getTextures() const { return textures; }
    std::size_t getTextureCount() const { return textures.size(); }
    std::size_t getCurrentTextureIndex() const { return currentTextureIndex; }
    std::size_t getSpriteListCount() const { return spriteLists.size(); }

    glm::vec2 center{0.f};
    float angle{0.f};
    glm::vec2 change{0.f};
    float changeAngle{0.f};
    float alpha{1.f};
    bool transparent{true};

  private:
    friend class SpriteList;

    void registerSpriteList(SpriteList &list);
    void unregisterSpriteList(const SpriteList &list);
    void applyTextureSize(const backend::RenderTexture &source);

    float scale{0.f};
    float width{0.f};
    float height{0.f};
    std::vector<backend::RenderTexturePtr> textures;
    std::size_t currentTextureIndex{0};
    backend::RenderTexturePtr texture;
    std::vector<SpriteList *> spriteLists;
  };

  using SpritePtr = std::shared_ptr<Sprite>;

} // namespace lse
