#pragma once

#include "Engine/Backend/Image/asset_factory.hpp"
#include "Engine/Backend/Recording/recording_backend.hpp"
#include "Engine/sprite_list.hpp"
#include "Game/platformer_sprite.hpp"

// std
#include <cstddef>
#include <memory>
#include <string>

namespace lse {

  // Headless frame loop: update, cull, draw into a recording backend.
  class EngineLoop {
  public:
    static constexpr std::size_t METEOR_COUNT = 16;
    static constexpr float WORLD_HALF_EXTENT = 1.f;

    explicit EngineLoop(const std::string &spriteMetaPath = {});

    EngineLoop(const EngineLoop &) = delete;
    EngineLoop &operator=(const EngineLoop &) = delete;

    void run(std::size_t frameCount);

  private:
    void setupPlayer(const std::string &spriteMetaPath);
    void setupMeteors();
    void cullMeteors();

    backend::ImageRenderAssetFactory assetFactory{};
    backend::RecordingRenderBackend renderBackend{};
    SpriteList allSprites;
    SpriteList meteors;
    std::shared_ptr<game::PlatformerSprite> player;
  };

} // namespace lse
