#pragma once

#include "Engine/Backend/render_assets.hpp"

namespace lse::backend {

  class RenderBackend {
  public:
    virtual ~RenderBackend() = default;

    // Draws texture stretched over a width x height rect centered on (centerX, centerY),
    // rotated by angleDegrees. Throws RenderError when no frame is active.
    virtual void drawTexturedRect(
      float centerX,
      float centerY,
      float width,
      float height,
      const RenderTexture &texture,
      float angleDegrees,
      float alpha,
      bool transparent) = 0;
  };

} // namespace lse::backend
