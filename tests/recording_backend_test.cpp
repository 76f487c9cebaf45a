#include "Engine/Backend/Recording/recording_backend.hpp"

#include "Engine/sprite_errors.hpp"
#include "Engine/sprite_list.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>

namespace lse::backend {

  TEST(RecordingRenderBackendTest, RecordsDrawsWithinFrame) {
    RecordingRenderBackend backend;
    auto texture = test::makeTexture(4, 4);

    backend.beginFrame();
    EXPECT_TRUE(backend.isFrameStarted());
    backend.drawTexturedRect(1.f, 2.f, 3.f, 4.f, *texture, 10.f, 0.5f, false);
    backend.endFrame();

    EXPECT_FALSE(backend.isFrameStarted());
    EXPECT_EQ(backend.getFrameCount(), 1u);
    ASSERT_EQ(backend.getCommands().size(), 1u);
    const DrawCommand &cmd = backend.getCommands().front();
    EXPECT_FLOAT_EQ(cmd.centerX, 1.f);
    EXPECT_FLOAT_EQ(cmd.centerY, 2.f);
    EXPECT_FLOAT_EQ(cmd.width, 3.f);
    EXPECT_FLOAT_EQ(cmd.height, 4.f);
    EXPECT_EQ(cmd.texture, texture.get());
    EXPECT_FLOAT_EQ(cmd.angleDegrees, 10.f);
    EXPECT_FLOAT_EQ(cmd.alpha, 0.5f);
    EXPECT_FALSE(cmd.transparent);
  }

  TEST(RecordingRenderBackendTest, NewFrameClearsCommands) {
    RecordingRenderBackend backend;
    auto texture = test::makeTexture(4, 4);
    backend.beginFrame();
    backend.drawTexturedRect(0.f, 0.f, 1.f, 1.f, *texture, 0.f, 1.f, true);
    backend.endFrame();

    backend.beginFrame();
    EXPECT_TRUE(backend.getCommands().empty());
    backend.endFrame();
    EXPECT_EQ(backend.getFrameCount(), 2u);
  }

  TEST(RecordingRenderBackendTest, DrawOutsideFrameIsRenderError) {
    RecordingRenderBackend backend;
    auto texture = test::makeTexture(4, 4);
    EXPECT_THROW(
      backend.drawTexturedRect(0.f, 0.f, 1.f, 1.f, *texture, 0.f, 1.f, true),
      RenderError);
  }

  TEST(RecordingRenderBackendTest, FrameCallsMustPair) {
    RecordingRenderBackend backend;
    EXPECT_THROW(backend.endFrame(), RenderError);
    backend.beginFrame();
    EXPECT_THROW(backend.beginFrame(), RenderError);
  }

  TEST(RecordingRenderBackendTest, SpriteListDrawsIntoFrame) {
    RecordingRenderBackend backend;
    SpriteList list;
    auto first = std::make_shared<Sprite>(test::makeTexture(2, 2), 1.f);
    auto frameless = std::make_shared<Sprite>();
    auto last = std::make_shared<Sprite>(test::makeTexture(2, 2), 1.f);
    last->setPosition(5.f, 6.f);
    list.append(first);
    list.append(frameless);
    list.append(last);

    EXPECT_THROW(list.draw(backend), RenderError);

    backend.beginFrame();
    list.draw(backend);
    backend.endFrame();

    ASSERT_EQ(backend.getCommands().size(), 2u);
    EXPECT_FLOAT_EQ(backend.getCommands()[1].centerX, 5.f);
    EXPECT_FLOAT_EQ(backend.getCommands()[1].centerY, 6.f);
  }

} // namespace lse::backend
