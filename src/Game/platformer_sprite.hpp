#pragma once

#include "Engine/sprite.hpp"

// std
#include <cstddef>
#include <utility>
#include <vector>

namespace lse::game {

  enum class Facing { Left, Right };

  struct PlatformerTuning {
    float speed{0.003f};
    float jumpSpeed{0.f};
    // horizontal distance to travel before the next walk frame is shown
    float textureChangeDistance{0.f};
  };

  /*
   * Sprite for side-on platformers. Frame selection is driven by velocity:
   * walking cycles through the walk table for the direction of travel, standing
   * shows the first stand frame for the current facing and any vertical motion
   * shows the first jump frame. Tables hold indices into the sprite's frames.
   * update() integrates position (Sprite::update) before choosing a frame, so
   * callers with their own physics step must not move the sprite again.
   */
  class PlatformerSprite : public Sprite {
  public:
    using FrameTable = std::vector<std::size_t>;

    using Sprite::Sprite;

    void update() override;

    void setLeftWalkTextures(FrameTable table) { leftWalkTextures = std::move(table); }
    void setRightWalkTextures(FrameTable table) { rightWalkTextures = std::move(table); }
    void setUpWalkTextures(FrameTable table) { upWalkTextures = std::move(table); }
    void setDownWalkTextures(FrameTable table) { downWalkTextures = std::move(table); }
    void setLeftStandTextures(FrameTable table) { leftStandTextures = std::move(table); }
    void setRightStandTextures(FrameTable table) { rightStandTextures = std::move(table); }
    void setUpStandTextures(FrameTable table) { upStandTextures = std::move(table); }
    void setDownStandTextures(FrameTable table) { downStandTextures = std::move(table); }
    void setLeftJumpTextures(FrameTable table) { leftJumpTextures = std::move(table); }
    void setRightJumpTextures(FrameTable table) { rightJumpTextures = std::move(table); }

    const FrameTable &getLeftWalkTextures() const { return leftWalkTextures; }
    const FrameTable &getRightWalkTextures() const { return rightWalkTextures; }
    const FrameTable &getUpWalkTextures() const { return upWalkTextures; }
    const FrameTable &getDownWalkTextures() const { return downWalkTextures; }
    const FrameTable &getLeftStandTextures() const { return leftStandTextures; }
    const FrameTable &getRightStandTextures() const { return rightStandTextures; }
    const FrameTable &getUpStandTextures() const { return upStandTextures; }
    const FrameTable &getDownStandTextures() const { return downStandTextures; }
    const FrameTable &getLeftJumpTextures() const { return leftJumpTextures; }
    const FrameTable &getRightJumpTextures() const { return rightJumpTextures; }

    void goLeft();
    void stopLeft();
    void goRight();
    void stopRight();
    void faceLeft();
    void faceRight();
    void jump();

    Facing getFacing() const { return facing; }
    float getLastChangeX() const { return lastChangeX; }
    PlatformerTuning &getTuning() { return tuning; }
    const PlatformerTuning &getTuning() const { return tuning; }

  private:
    void advanceWalkFrame(const FrameTable &table);
    void showFirstFrame(const FrameTable &table);

    Facing facing{Facing::Right};
    float lastChangeX{0.f};
    PlatformerTuning tuning{};

    FrameTable leftWalkTextures;
    FrameTable rightWalkTextures;
    FrameTable upWalkTextures;
    FrameTable downWalkTextures;
    FrameTable leftStandTextures;
    FrameTable rightStandTextures;
    FrameTable upStandTextures;
    FrameTable downStandTextures;
    FrameTable leftJumpTextures;
    FrameTable rightJumpTextures;
  };

} // namespace lse::game
