#include "utils/sprite_metadata.hpp"

#include "Engine/sprite_errors.hpp"
#include "test_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace lse {
  namespace {
    using ::testing::_;
    using ::testing::Return;
    using ::testing::Throw;

    const char *kHeroSheet = R"({
      "scale": 0.5,
      "speed": 0.01,
      "jumpSpeed": 0.02,
      "textureChangeDistance": 0.05,
      "frames": [
        { "texture": "hero.png", "x": 0, "y": 0, "w": 16, "h": 24 },
        { "texture": "hero.png", "x": 16, "y": 0, "w": 16, "h": 24 },
        { "texture": "/abs/stand.png" }
      ],
      "tables": {
        "rightWalk": [0, 1],
        "rightStand": [2],
        "leftJump": [1]
      }
    })";
  } // namespace

  TEST(SpriteMetadataTest, ParsesFramesTablesAndTuning) {
    SpriteMetadata metadata{};
    std::string error;

    ASSERT_TRUE(parseSpriteMetadata(kHeroSheet, "assets/hero", metadata, &error)) << error;

    EXPECT_FLOAT_EQ(metadata.scale, 0.5f);
    EXPECT_FLOAT_EQ(metadata.tuning.speed, 0.01f);
    EXPECT_FLOAT_EQ(metadata.tuning.jumpSpeed, 0.02f);
    EXPECT_FLOAT_EQ(metadata.tuning.textureChangeDistance, 0.05f);
    ASSERT_EQ(metadata.frames.size(), 3u);
    EXPECT_EQ(metadata.frames[0].texturePath, "assets/hero/hero.png");
    EXPECT_EQ(metadata.frames[1].region.x, 16);
    EXPECT_EQ(metadata.frames[1].region.width, 16);
    EXPECT_EQ(metadata.frames[2].texturePath, "/abs/stand.png");
    EXPECT_TRUE(metadata.frames[2].region.isWholeImage());
    EXPECT_EQ(metadata.tables.at("rightWalk"), (game::PlatformerSprite::FrameTable{0, 1}));
    EXPECT_EQ(metadata.tables.count("leftWalk"), 0u);
  }

  TEST(SpriteMetadataTest, MissingValuesFallBackToDefaults) {
    SpriteMetadata metadata{};
    ASSERT_TRUE(parseSpriteMetadata("{}", "", metadata));
    EXPECT_FLOAT_EQ(metadata.scale, 1.f);
    EXPECT_FLOAT_EQ(metadata.tuning.speed, 0.003f);
    EXPECT_TRUE(metadata.frames.empty());
    EXPECT_TRUE(metadata.tables.empty());
  }

  TEST(SpriteMetadataTest, ReportsMalformedDocuments) {
    SpriteMetadata metadata{};
    std::string error;

    EXPECT_FALSE(parseSpriteMetadata("{ \"scale\": ", "", metadata, &error));
    EXPECT_NE(error.find("json parse error"), std::string::npos);

    EXPECT_FALSE(parseSpriteMetadata("[1, 2]", "", metadata, &error));
    EXPECT_FALSE(parseSpriteMetadata(R"({"frames": [{"x": 1}]})", "", metadata, &error));
    EXPECT_FALSE(parseSpriteMetadata(R"({"tables": {"sideways": []}})", "", metadata, &error));
    EXPECT_NE(error.find("sideways"), std::string::npos);
    EXPECT_FALSE(parseSpriteMetadata(
      R"({"frames": [{"texture": "a.png"}], "tables": {"leftWalk": [1]}})", "", metadata, &error));
    EXPECT_FALSE(parseSpriteMetadata(R"({"scale": -2})", "", metadata, &error));
  }

  TEST(SpriteMetadataTest, LoadsFromFileRelativeToItsDirectory) {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "lse_sprite_metadata_test";
    fs::create_directories(dir);
    const fs::path file = dir / "hero.json";
    {
      std::ofstream out(file, std::ios::out | std::ios::binary);
      out << kHeroSheet;
    }

    SpriteMetadata metadata{};
    std::string error;
    const bool loaded = loadSpriteMetadata(file.string(), metadata, &error);
    std::error_code ec;
    fs::remove_all(dir, ec);

    ASSERT_TRUE(loaded) << error;
    EXPECT_EQ(metadata.frames[0].texturePath, (dir / "hero.png").lexically_normal().generic_string());
  }

  TEST(SpriteMetadataTest, LoadFailsForMissingFile) {
    SpriteMetadata metadata{};
    std::string error;
    EXPECT_FALSE(loadSpriteMetadata("no/such/sheet.json", metadata, &error));
    EXPECT_NE(error.find("no/such/sheet.json"), std::string::npos);
  }

  TEST(SpriteMetadataTest, AppliesToPlatformerSprite) {
    SpriteMetadata metadata{};
    ASSERT_TRUE(parseSpriteMetadata(kHeroSheet, "", metadata));

    test::MockAssetFactory assets;
    EXPECT_CALL(assets, loadTexture("hero.png", test::RegionIs(0, 0, 16, 24)))
      .WillOnce(Return(test::makeTexture(16, 24)));
    EXPECT_CALL(assets, loadTexture("hero.png", test::RegionIs(16, 0, 16, 24)))
      .WillOnce(Return(test::makeTexture(16, 24)));
    EXPECT_CALL(assets, loadTexture("/abs/stand.png", test::RegionIs(0, 0, 0, 0)))
      .WillOnce(Return(test::makeTexture(20, 30)));

    game::PlatformerSprite sprite{};
    std::string error;
    ASSERT_TRUE(applySpriteMetadata(metadata, assets, sprite, &error)) << error;

    EXPECT_EQ(sprite.getTextureCount(), 3u);
    EXPECT_EQ(sprite.getCurrentTextureIndex(), 0u);
    EXPECT_FLOAT_EQ(sprite.getWidth(), 8.f);
    EXPECT_EQ(sprite.getRightWalkTextures(), (game::PlatformerSprite::FrameTable{0, 1}));
    EXPECT_EQ(sprite.getRightStandTextures(), (game::PlatformerSprite::FrameTable{2}));
    EXPECT_EQ(sprite.getLeftJumpTextures(), (game::PlatformerSprite::FrameTable{1}));
    EXPECT_FLOAT_EQ(sprite.getTuning().speed, 0.01f);

    sprite.update();
    EXPECT_EQ(sprite.getCurrentTextureIndex(), 2u);
    EXPECT_FLOAT_EQ(sprite.getWidth(), 10.f);
  }

  TEST(SpriteMetadataTest, TablesAreOffsetPastExistingFrames) {
    SpriteMetadata metadata{};
    ASSERT_TRUE(parseSpriteMetadata(
      R"({"frames": [{"texture": "a.png"}], "tables": {"leftStand": [0]}})", "", metadata));

    test::MockAssetFactory assets;
    EXPECT_CALL(assets, loadTexture("a.png", _)).WillOnce(Return(test::makeTexture(4, 4)));

    game::PlatformerSprite sprite{test::makeTexture(2, 2), 1.f};
    ASSERT_TRUE(applySpriteMetadata(metadata, assets, sprite));

    EXPECT_EQ(sprite.getTextureCount(), 2u);
    EXPECT_EQ(sprite.getCurrentTextureIndex(), 0u);
    EXPECT_EQ(sprite.getLeftStandTextures(), (game::PlatformerSprite::FrameTable{1}));
  }

  TEST(SpriteMetadataTest, LoadFailureLeavesSpriteUntouched) {
    SpriteMetadata metadata{};
    ASSERT_TRUE(parseSpriteMetadata(kHeroSheet, "", metadata));

    test::MockAssetFactory assets;
    EXPECT_CALL(assets, loadTexture(_, _))
      .WillOnce(Return(test::makeTexture(16, 24)))
      .WillOnce(Throw(TextureDecodeError("bad png")));

    game::PlatformerSprite sprite{};
    std::string error;
    EXPECT_FALSE(applySpriteMetadata(metadata, assets, sprite, &error));
    EXPECT_EQ(error, "bad png");
    EXPECT_EQ(sprite.getTextureCount(), 0u);
    EXPECT_TRUE(sprite.getRightWalkTextures().empty());
  }

  TEST(SpriteMetadataTest, ApplyRejectsHandBuiltTablesWithUnknownNames) {
    SpriteMetadata metadata{};
    metadata.tables["diagonal"] = {0};
    test::MockAssetFactory assets;
    EXPECT_CALL(assets, loadTexture(_, _)).Times(0);

    game::PlatformerSprite sprite{};
    std::string error;
    EXPECT_FALSE(applySpriteMetadata(metadata, assets, sprite, &error));
    EXPECT_NE(error.find("diagonal"), std::string::npos);
  }

} // namespace lse
