#include "Engine/Backend/Recording/recording_backend.hpp"

#include "Engine/sprite_errors.hpp"

namespace lse::backend {

  void RecordingRenderBackend::beginFrame() {
    if (frameStarted) {
      throw RenderError("beginFrame called while frame already in progress");
    }
    commands.clear();
    frameStarted = true;
  }

  void RecordingRenderBackend::endFrame() {
    if (!frameStarted) {
      throw RenderError("endFrame called without an active frame");
    }
    frameStarted = false;
    ++frameCount;
  }

  void RecordingRenderBackend::drawTexturedRect(
    float centerX,
    float centerY,
    float width,
    float height,
    const RenderTexture &texture,
    float angleDegrees,
    float alpha,
    bool transparent) {
    if (!frameStarted) {
      throw RenderError("drawTexturedRect called without an active frame");
    }

    DrawCommand command{};
    command.centerX = centerX;
    command.centerY = centerY;
    command.width = width;
    command.height = height;
    command.texture = &texture;
    command.angleDegrees = angleDegrees;
    command.alpha = alpha;
    command.transparent = transparent;
    commands.push_back(command);
  }

} // namespace lse::backend
