#include "Engine/geometry.hpp"

// libs
#include <glm/trigonometric.hpp>

// std
#include <cmath>

namespace lse {

  glm::vec2 rotatePoint(const glm::vec2 &point, const glm::vec2 &pivot, float angleDegrees) {
    const float radians = glm::radians(angleDegrees);
    const float c = std::cos(radians);
    const float s = std::sin(radians);
    const glm::vec2 d = point - pivot;
    return glm::vec2{
      pivot.x + d.x * c - d.y * s,
      pivot.y + d.x * s + d.y * c};
  }

} // namespace lse
