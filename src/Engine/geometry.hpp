#pragma once

// libs
#include <glm/vec2.hpp>

namespace lse {

  // Rotates point about pivot. Positive angles turn counter-clockwise with +Y up.
  glm::vec2 rotatePoint(const glm::vec2 &point, const glm::vec2 &pivot, float angleDegrees);

} // namespace lse
