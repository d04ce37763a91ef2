#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace iris {

// 2D orthographic camera. World units: the loaded image's longer side spans
// [-1, 1]; the viewport shows [-aspect, aspect] x [-1, 1] at zoom 1.
struct Camera {
  static constexpr float kMinZoom = 0.1f;
  static constexpr float kMaxZoom = 10.0f;

  glm::vec2 position{0.0f, 0.0f};
  float zoom = 1.0f;
  float aspectRatio = 1.0f;

  // No-op when height is 0.
  void setViewportSize(std::uint32_t width, std::uint32_t height);

  // projection * scale(zoom) * translate(-position); depth maps to [0, 1].
  glm::mat4 buildViewProjectionMatrix() const;

  // Multiplies zoom by factor, clamped to [kMinZoom, kMaxZoom].
  void zoomBy(float factor);

  // Moves the view by a screen-space drag of (dx, dy) pixels, y pointing down.
  void panByPixels(float dx, float dy, std::uint32_t viewportHeight);
};

}  // namespace iris
