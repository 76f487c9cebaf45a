#pragma once

#include "Engine/Backend/render_assets.hpp"
#include "Game/platformer_sprite.hpp"

// std
#include <map>
#include <string>
#include <vector>

namespace lse {

  struct SpriteFrameInfo {
    std::string texturePath{}; // resolved against the metadata file's directory
    backend::TextureRegion region{};
  };

  struct SpriteMetadata {
    float scale{1.f};
    game::PlatformerTuning tuning{};
    std::vector<SpriteFrameInfo> frames;
    // table name (leftWalk, rightStand, leftJump, ...) -> indices into frames
    std::map<std::string, game::PlatformerSprite::FrameTable> tables;
  };

  bool parseSpriteMetadata(
    const std::string &json,
    const std::string &baseDir,
    SpriteMetadata &outMetadata,
    std::string *outError = nullptr);

  bool loadSpriteMetadata(
    const std::string &filepath,
    SpriteMetadata &outMetadata,
    std::string *outError = nullptr);

  // Loads every frame, then appends them to sprite and installs the tables and tuning.
  // The sprite is left untouched when any frame fails to load.
  bool applySpriteMetadata(
    const SpriteMetadata &metadata,
    backend::RenderAssetFactory &assets,
    game::PlatformerSprite &sprite,
    std::string *outError = nullptr);

} // namespace lse
