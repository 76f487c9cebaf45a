#include "utils/sprite_metadata.hpp"

#include "Engine/sprite_errors.hpp"

// libs
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

// std
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace lse {

  namespace {
    using FrameTable = game::PlatformerSprite::FrameTable;
    using TableSetter = void (game::PlatformerSprite::*)(FrameTable);

    struct TableBinding {
      const char *name;
      TableSetter setter;
    };

    const TableBinding kTableBindings[] = {
      {"leftWalk", &game::PlatformerSprite::setLeftWalkTextures},
      {"rightWalk", &game::PlatformerSprite::setRightWalkTextures},
      {"upWalk", &game::PlatformerSprite::setUpWalkTextures},
      {"downWalk", &game::PlatformerSprite::setDownWalkTextures},
      {"leftStand", &game::PlatformerSprite::setLeftStandTextures},
      {"rightStand", &game::PlatformerSprite::setRightStandTextures},
      {"upStand", &game::PlatformerSprite::setUpStandTextures},
      {"downStand", &game::PlatformerSprite::setDownStandTextures},
      {"leftJump", &game::PlatformerSprite::setLeftJumpTextures},
      {"rightJump", &game::PlatformerSprite::setRightJumpTextures},
    };

    const TableBinding *findBinding(const std::string &name) {
      for (const auto &binding : kTableBindings) {
        if (name == binding.name) {
          return &binding;
        }
      }
      return nullptr;
    }

    void setError(std::string *outError, const std::string &message) {
      if (outError) {
        *outError = message;
      }
    }

    std::string readFileToString(const std::string &path) {
      std::ifstream file(path, std::ios::in | std::ios::binary);
      if (!file) return {};
      std::ostringstream ss;
      ss << file.rdbuf();
      return ss.str();
    }

    float readFloat(const rapidjson::Value &obj, const char *key, float defaultValue) {
      if (obj.HasMember(key) && obj[key].IsNumber()) {
        return obj[key].GetFloat();
      }
      return defaultValue;
    }

    int readInt(const rapidjson::Value &obj, const char *key, int defaultValue) {
      if (obj.HasMember(key) && obj[key].IsInt()) {
        return obj[key].GetInt();
      }
      return defaultValue;
    }

    std::string resolvePath(const std::string &baseDir, const std::string &path) {
      std::filesystem::path resolved{path};
      if (resolved.is_relative() && !baseDir.empty()) {
        resolved = std::filesystem::path{baseDir} / resolved;
      }
      return resolved.lexically_normal().generic_string();
    }
  } // namespace

  bool parseSpriteMetadata(
    const std::string &json,
    const std::string &baseDir,
    SpriteMetadata &outMetadata,
    std::string *outError) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError()) {
      std::string msg = rapidjson::GetParseError_En(doc.GetParseError());
      setError(outError, "json parse error at " + std::to_string(doc.GetErrorOffset()) + ": " + msg);
      return false;
    }
    if (!doc.IsObject()) {
      setError(outError, "sprite metadata root is not an object");
      return false;
    }

    SpriteMetadata metadata{};
    metadata.scale = readFloat(doc, "scale", metadata.scale);
    metadata.tuning.speed = readFloat(doc, "speed", metadata.tuning.speed);
    metadata.tuning.jumpSpeed = readFloat(doc, "jumpSpeed", metadata.tuning.jumpSpeed);
    metadata.tuning.textureChangeDistance =
      readFloat(doc, "textureChangeDistance", metadata.tuning.textureChangeDistance);
    if (metadata.scale < 0.f) {
      setError(outError, "scale can't be less than zero");
      return false;
    }

    if (doc.HasMember("frames")) {
      if (!doc["frames"].IsArray()) {
        setError(outError, "\"frames\" must be an array");
        return false;
      }
      for (const auto &frameVal : doc["frames"].GetArray()) {
        if (!frameVal.IsObject() || !frameVal.HasMember("texture") || !frameVal["texture"].IsString()) {
          setError(outError, "frame " + std::to_string(metadata.frames.size()) + " has no texture path");
          return false;
        }
        SpriteFrameInfo frame{};
        frame.texturePath = resolvePath(baseDir, frameVal["texture"].GetString());
        frame.region.x = readInt(frameVal, "x", 0);
        frame.region.y = readInt(frameVal, "y", 0);
        frame.region.width = readInt(frameVal, "w", 0);
        frame.region.height = readInt(frameVal, "h", 0);
        metadata.frames.push_back(std::move(frame));
      }
    }

    if (doc.HasMember("tables")) {
      if (!doc["tables"].IsObject()) {
        setError(outError, "\"tables\" must be an object");
        return false;
      }
      for (const auto &member : doc["tables"].GetObject()) {
        const std::string name = member.name.GetString();
        if (!findBinding(name)) {
          setError(outError, "unknown frame table: " + name);
          return false;
        }
        if (!member.value.IsArray()) {
          setError(outError, "frame table " + name + " must be an array");
          return false;
        }
        FrameTable table;
        for (const auto &indexVal : member.value.GetArray()) {
          if (!indexVal.IsUint() || indexVal.GetUint() >= metadata.frames.size()) {
            setError(outError, "frame table " + name + " references a missing frame");
            return false;
          }
          table.push_back(indexVal.GetUint());
        }
        metadata.tables[name] = std::move(table);
      }
    }

    outMetadata = std::move(metadata);
    return true;
  }

  bool loadSpriteMetadata(const std::string &filepath, SpriteMetadata &outMetadata, std::string *outError) {
    const std::string content = readFileToString(filepath);
    if (content.empty()) {
      setError(outError, "failed to read sprite metadata: " + filepath);
      return false;
    }
    const std::string baseDir = std::filesystem::path{filepath}.parent_path().generic_string();
    return parseSpriteMetadata(content, baseDir, outMetadata, outError);
  }

  bool applySpriteMetadata(
    const SpriteMetadata &metadata,
    backend::RenderAssetFactory &assets,
    game::PlatformerSprite &sprite,
    std::string *outError) {
    if (metadata.scale < 0.f) {
      setError(outError, "scale can't be less than zero");
      return false;
    }
    for (const auto &entry : metadata.tables) {
      if (!findBinding(entry.first)) {
        setError(outError, "unknown frame table: " + entry.first);
        return false;
      }
      for (std::size_t index : entry.second) {
        if (index >= metadata.frames.size()) {
          setError(outError, "frame table " + entry.first + " references a missing frame");
          return false;
        }
      }
    }

    std::vector<backend::RenderTexturePtr> loaded;
    loaded.reserve(metadata.frames.size());
    for (const auto &frame : metadata.frames) {
      try {
        auto texture = assets.loadTexture(frame.texturePath, frame.region);
        if (!texture) {
          setError(outError, "no texture returned for " + frame.texturePath);
          return false;
        }
        loaded.push_back(std::move(texture));
      } catch (const TextureLoadError &e) {
        std::cerr << "Failed to load sprite frame: " << frame.texturePath << " - " << e.what() << "\n";
        setError(outError, e.what());
        return false;
      }
    }

    const std::size_t base = sprite.getTextureCount();
    sprite.setScale(metadata.scale);
    for (auto &texture : loaded) {
      sprite.appendTexture(std::move(texture));
    }
    for (const auto &entry : metadata.tables) {
      FrameTable table = entry.second;
      for (auto &index : table) {
        index += base;
      }
      const TableBinding *binding = findBinding(entry.first);
      (sprite.*(binding->setter))(std::move(table));
    }
    sprite.getTuning() = metadata.tuning;

    if (base == 0 && sprite.getTextureCount() > 0) {
      sprite.setTexture(0);
    }
    return true;
  }

} // namespace lse
