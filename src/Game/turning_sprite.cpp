#include "Game/turning_sprite.hpp"

// libs
#include <glm/trigonometric.hpp>

// std
#include <cmath>

namespace lse::game {

  void TurningSprite::update() {
    Sprite::update();
    // artwork points up, so heading 0 (+X) needs a -90 offset
    angle = glm::degrees(std::atan2(change.y, change.x)) - 90.f;
  }

} // namespace lse::game
