#include "Game/platformer_sprite.hpp"

// std
#include <algorithm>
#include <cmath>

namespace lse::game {

  void PlatformerSprite::update() {
    Sprite::update();

    if (change.y == 0.f) {
      const bool movedFarEnough = std::abs(lastChangeX - center.x) > tuning.textureChangeDistance;
      if (change.x < 0.f) {
        if (movedFarEnough) {
          advanceWalkFrame(leftWalkTextures);
          lastChangeX = center.x;
        }
      } else if (change.x > 0.f) {
        if (movedFarEnough) {
          advanceWalkFrame(rightWalkTextures);
          lastChangeX = center.x;
        }
      } else {
        showFirstFrame(facing == Facing::Left ? leftStandTextures : rightStandTextures);
      }
    } else {
      showFirstFrame(facing == Facing::Left ? leftJumpTextures : rightJumpTextures);
    }
  }

  void PlatformerSprite::advanceWalkFrame(const FrameTable &table) {
    if (table.empty()) {
      return;
    }
    std::size_t pos = 0;
    auto it = std::find(table.begin(), table.end(), getCurrentTextureIndex());
    if (it != table.end()) {
      pos = static_cast<std::size_t>(it - table.begin()) + 1;
    }
    if (pos >= table.size()) {
      pos = 0;
    }
    setTexture(table[pos]);
  }

  void PlatformerSprite::showFirstFrame(const FrameTable &table) {
    if (!table.empty()) {
      setTexture(table.front());
    }
  }

  void PlatformerSprite::goLeft() {
    if (change.x >= 0.f) {
      change.x = -tuning.speed;
    }
  }

  void PlatformerSprite::stopLeft() {
    if (change.x < 0.f) {
      change.x = 0.f;
    }
  }

  void PlatformerSprite::goRight() {
    if (change.x <= 0.f) {
      change.x = tuning.speed;
    }
  }

  void PlatformerSprite::stopRight() {
    if (change.x > 0.f) {
      change.x = 0.f;
    }
  }

  void PlatformerSprite::faceLeft() {
    facing = Facing::Left;
  }

  void PlatformerSprite::faceRight() {
    facing = Facing::Right;
  }

  void PlatformerSprite::jump() {
    change.y = tuning.jumpSpeed;
  }

} // namespace lse::game
