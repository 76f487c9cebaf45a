#pragma once

#include "Engine/sprite.hpp"

namespace lse::game {

  // Sprite that turns to face the direction it is travelling in.
  class TurningSprite : public Sprite {
  public:
    using Sprite::Sprite;

    void update() override;
  };

} // namespace lse::game
