#include "Engine/engine_loop.hpp"

#include "Engine/Backend/Image/image_texture.hpp"
#include "Engine/IO/image_io.hpp"
#include "Game/turning_sprite.hpp"
#include "utils/sprite_metadata.hpp"

// std
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lse {
  namespace {
    backend::RenderTexturePtr makeSolidTexture(int width, int height, unsigned char shade) {
      std::vector<unsigned char> pixels(static_cast<std::size_t>(width) * height * 4, shade);
      ImageData image{};
      std::string error;
      if (!loadImageDataFromRgba(pixels.data(), width, height, image, &error)) {
        throw std::runtime_error("failed to build demo texture: " + error);
      }
      return std::make_shared<backend::ImageTexture>(std::move(image));
    }
  } // namespace

  EngineLoop::EngineLoop(const std::string &spriteMetaPath) {
    setupPlayer(spriteMetaPath);
    setupMeteors();
  }

  void EngineLoop::setupPlayer(const std::string &spriteMetaPath) {
    player = std::make_shared<game::PlatformerSprite>();

    bool configured = false;
    if (!spriteMetaPath.empty()) {
      SpriteMetadata metadata{};
      std::string error;
      if (!loadSpriteMetadata(spriteMetaPath, metadata, &error)) {
        std::cerr << "Failed to load sprite metadata " << spriteMetaPath << ": " << error << "\n";
      } else if (!applySpriteMetadata(metadata, assetFactory, *player, &error)) {
        std::cerr << "Failed to apply sprite metadata " << spriteMetaPath << ": " << error << "\n";
      } else {
        configured = true;
      }
    }

    if (!configured) {
      // frames 0-1 walk right, 2-3 walk left, 4-5 stand, 6-7 jump
      player->setScale(1.f / 320.f);
      for (unsigned char shade = 0; shade < 8; ++shade) {
        player->appendTexture(makeSolidTexture(32, 48, static_cast<unsigned char>(32 * shade)));
      }
      player->setRightWalkTextures({0, 1});
      player->setLeftWalkTextures({2, 3});
      player->setRightStandTextures({4});
      player->setLeftStandTextures({5});
      player->setRightJumpTextures({6});
      player->setLeftJumpTextures({7});
      player->getTuning().textureChangeDistance = 0.01f;
      player->setTexture(4);
    }

    player->setBottom(-WORLD_HALF_EXTENT);
    allSprites.append(player);
  }

  void EngineLoop::setupMeteors() {
    const auto meteorTexture = makeSolidTexture(16, 16, 200);
    for (std::size_t i = 0; i < METEOR_COUNT; ++i) {
      auto meteor = std::make_shared<game::TurningSprite>(meteorTexture, 1.f / 200.f);
      const float t = static_cast<float>(i) / static_cast<float>(METEOR_COUNT);
      meteor->setPosition(2.f * t - 1.f, WORLD_HALF_EXTENT);
      meteor->change = {0.002f * std::cos(7.f * t), -0.01f - 0.01f * t};
      allSprites.append(meteor);
      meteors.append(meteor);
    }
  }

  void EngineLoop::cullMeteors() {
    std::vector<SpritePtr> fallen;
    for (const auto &meteor : meteors) {
      if (meteor->getTop() < -WORLD_HALF_EXTENT) {
        fallen.push_back(meteor);
      }
    }
    for (const auto &meteor : fallen) {
      meteor->kill();
    }
  }

  void EngineLoop::run(std::size_t frameCount) {
    std::size_t drawCalls = 0;
    for (std::size_t frame = 0; frame < frameCount; ++frame) {
      // walk right for the first half, then left
      if (frame < frameCount / 2) {
        player->faceRight();
        player->goRight();
      } else {
        player->stopRight();
        player->faceLeft();
        player->goLeft();
      }

      allSprites.update();
      cullMeteors();

      renderBackend.beginFrame();
      allSprites.draw(renderBackend);
      renderBackend.endFrame();
      drawCalls += renderBackend.getCommands().size();
    }

    std::cout << "frames: " << renderBackend.getFrameCount()
              << ", draw calls: " << drawCalls
              << ", meteors left: " << meteors.size()
              << ", player at (" << player->center.x << ", " << player->center.y << ")"
              << ", frame " << player->getCurrentTextureIndex() << "\n";
  }

} // namespace lse
