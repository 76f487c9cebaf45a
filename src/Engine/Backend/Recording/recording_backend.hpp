#pragma once

#include "Engine/Backend/render_backend.hpp"

// std
#include <cstddef>
#include <vector>

namespace lse::backend {

  struct DrawCommand {
    float centerX{0.f};
    float centerY{0.f};
    float width{0.f};
    float height{0.f};
    const RenderTexture *texture{nullptr};
    float angleDegrees{0.f};
    float alpha{1.f};
    bool transparent{true};
  };

  // Headless backend. Collects the draw calls issued between beginFrame() and endFrame().
  class RecordingRenderBackend final : public RenderBackend {
  public:
    void beginFrame();
    void endFrame();

    void drawTexturedRect(
      float centerX,
      float centerY,
      float width,
      float height,
      const RenderTexture &texture,
      float angleDegrees,
      float alpha,
      bool transparent) override;

    bool isFrameStarted() const { return frameStarted; }
    std::size_t getFrameCount() const { return frameCount; }
    // Commands of the frame in progress, or of the last finished frame.
    const std::vector<DrawCommand> &getCommands() const { return commands; }

  private:
    bool frameStarted{false};
    std::size_t frameCount{0};
    std::vector<DrawCommand> commands;
  };

} // namespace lse::backend
