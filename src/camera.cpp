#include "iris/camera.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>

namespace iris {

void Camera::setViewportSize(std::uint32_t width, std::uint32_t height) {
  if (height > 0) {
    aspectRatio = static_cast<float>(width) / static_cast<float>(height);
  }
}

glm::mat4 Camera::buildViewProjectionMatrix() const {
  const glm::mat4 projection =
      glm::orthoRH_ZO(-aspectRatio, aspectRatio, -1.0f, 1.0f, -1.0f, 1.0f);
  const glm::mat4 view = glm::scale(glm::mat4(1.0f), glm::vec3(zoom, zoom, 1.0f)) *
                         glm::translate(glm::mat4(1.0f), glm::vec3(-position, 0.0f));
  return projection * view;
}

void Camera::zoomBy(float factor) {
  if (!(factor > 0.0f)) return;
  zoom = std::clamp(zoom * factor, kMinZoom, kMaxZoom);
}

void Camera::panByPixels(float dx, float dy, std::uint32_t viewportHeight) {
  if (viewportHeight == 0) return;
  // The visible vertical extent is 2 / zoom world units.
  const float worldPerPixel = 2.0f / (static_cast<float>(viewportHeight) * zoom);
  position.x -= dx * worldPerPixel;
  position.y += dy * worldPerPixel;
}

}  // namespace iris
