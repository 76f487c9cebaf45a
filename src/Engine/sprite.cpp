#include "Engine/sprite.hpp"

#include "Engine/geometry.hpp"
#include "Engine/sprite_errors.hpp"
#include "Engine/sprite_list.hpp"

// std
#include <algorithm>
#include <utility>

namespace lse {

  namespace {
    void validateRegion(const backend::TextureRegion &region) {
      if (region.width < 0) {
        throw InvalidSpriteSize("width of image can't be less than zero");
      }
      if (region.height < 0) {
        throw InvalidSpriteSize("height of image can't be less than zero");
      }
      if (region.width == 0 && region.height != 0) {
        throw InvalidSpriteSize("width can't be zero when height is set");
      }
      if (region.height == 0 && region.width != 0) {
        throw InvalidSpriteSize("height can't be zero when width is set");
      }
    }

    void validateScale(float scale) {
      if (scale < 0.f) {
        throw InvalidSpriteSize("scale can't be less than zero");
      }
    }
  } // namespace

  Sprite::Sprite(const SpriteCreateInfo &info) : scale{info.scale} {
    validateRegion(info.region);
    validateScale(info.scale);

    if (!info.filename.empty()) {
      if (!info.assets) {
        throw InvalidSpriteSize("sprite file given without an asset factory: " + info.filename);
      }
      auto loaded = info.assets->loadTexture(info.filename, info.region);
      if (!loaded) {
        throw TextureTypeMismatch("asset factory returned no texture for " + info.filename);
      }
      textures.push_back(loaded);
      texture = std::move(loaded);
      applyTextureSize(*texture);
    }
  }

  Sprite::Sprite(backend::RenderTexturePtr initialTexture, float scale) : scale{scale} {
    validateScale(scale);
    if (!initialTexture) {
      throw TextureTypeMismatch("can't create a sprite from a null texture");
    }
    textures.push_back(initialTexture);
    texture = std::move(initialTexture);
    applyTextureSize(*texture);
  }

  void Sprite::appendTexture(backend::RenderTexturePtr frame) {
    if (!frame) {
      throw TextureTypeMismatch("can't append a null texture frame");
    }
    textures.push_back(std::move(frame));
  }

  void Sprite::setTexture(std::size_t frameIndex) {
    if (frameIndex >= textures.size()) {
      throw TextureIndexOutOfRange(
        "texture frame " + std::to_string(frameIndex) + " out of range (" +
        std::to_string(textures.size()) + " frames)");
    }
    texture = textures[frameIndex];
    currentTextureIndex = frameIndex;
    applyTextureSize(*texture);
  }

  void Sprite::setActiveTexture(backend::RenderTexturePtr newTexture) {
    if (!newTexture) {
      throw TextureTypeMismatch("can't set the texture to something that is not a texture");
    }
    texture = std::move(newTexture);
  }

  void Sprite::setPosition(float x, float y) {
    center.x = x;
    center.y = y;
  }

  void Sprite::setScale(float newScale) {
    validateScale(newScale);
    scale = newScale;
    if (texture) {
      applyTextureSize(*texture);
    }
  }

  void Sprite::applyTextureSize(const backend::RenderTexture &source) {
    width = static_cast<float>(source.getWidth()) * scale;
    height = static_cast<float>(source.getHeight()) * scale;
  }

  Sprite::Points Sprite::getPoints() const {
    const float halfW = width / 2.f;
    const float halfH = height / 2.f;
    return Points{
      rotatePoint({center.x - halfW, center.y - halfH}, center, angle),
      rotatePoint({center.x + halfW, center.y - halfH}, center, angle),
      rotatePoint({center.x + halfW, center.y + halfH}, center, angle),
      rotatePoint({center.x - halfW, center.y + halfH}, center, angle)};
  }

  float Sprite::getBottom() const {
    const Points points = getPoints();
    return std::min({points[0].y, points[1].y, points[2].y, points[3].y});
  }

  float Sprite::getTop() const {
    const Points points = getPoints();
    return std::max({points[0].y, points[1].y, points[2].y, points[3].y});
  }

  float Sprite::getLeft() const {
    const Points points = getPoints();
    return std::min({points[0].x, points[1].x, points[2].x, points[3].x});
  }

  float Sprite::getRight() const {
    const Points points = getPoints();
    return std::max({points[0].x, points[1].x, points[2].x, points[3].x});
  }

  SpriteBounds Sprite::getBounds() const {
    const Points points = getPoints();
    SpriteBounds bounds{};
    bounds.left = std::min({points[0].x, points[1].x, points[2].x, points[3].x});
    bounds.bottom = std::min({points[0].y, points[1].y, points[2].y, points[3].y});
    bounds.right = std::max({points[0].x, points[1].x, points[2].x, points[3].x});
    bounds.top = std::max({points[0].y, points[1].y, points[2].y, points[3].y});
    return bounds;
  }

  void Sprite::setBottom(float value) {
    const float diff = getBottom() - value;
    center.y -= diff;
  }

  void Sprite::setTop(float value) {
    const float diff = getTop() - value;
    center.y -= diff;
  }

  void Sprite::setLeft(float value) {
    const float diff = value - getLeft();
    center.x += diff;
  }

  void Sprite::setRight(float value) {
    const float diff = getRight() - value;
    center.x -= diff;
  }

  void Sprite::update() {
    center += change;
    angle += changeAngle;
  }

  void Sprite::draw(backend::RenderBackend &renderer) const {
    if (!texture) {
      return;
    }
    renderer.drawTexturedRect(
      center.x,
      center.y,
      width,
      height,
      *texture,
      angle,
      alpha,
      transparent);
  }

  void Sprite::kill() {
    if (spriteLists.empty()) {
      return;
    }
    // the last owning list may release this sprite mid-loop
    const SpritePtr keepAlive = weak_from_this().lock();
    const std::vector<SpriteList *> lists = spriteLists;
    for (SpriteList *list : lists) {
      if (list->contains(*this)) {
        list->remove(*this);
      }
    }
  }

  void Sprite::registerSpriteList(SpriteList &list) {
    spriteLists.push_back(&list);
  }

  void Sprite::unregisterSpriteList(const SpriteList &list) {
    auto it = std::find(spriteLists.begin(), spriteLists.end(), &list);
    if (it != spriteLists.end()) {
      spriteLists.erase(it);
    }
  }

} // namespace lse
