#include <gtest/gtest.h>

#include <glm/glm.hpp>

#include "iris/camera.hpp"

using iris::Camera;

namespace {

glm::vec4 project(const Camera& camera, float x, float y) {
  return camera.buildViewProjectionMatrix() * glm::vec4(x, y, 0.0f, 1.0f);
}

}  // namespace

TEST(Camera, DefaultIsIdentityInXY) {
  Camera camera;
  const glm::mat4 m = camera.buildViewProjectionMatrix();
  for (int col = 0; col < 4; ++col) {
    for (int row = 0; row < 2; ++row) {
      EXPECT_FLOAT_EQ(m[col][row], col == row ? 1.0f : 0.0f) << "col " << col << " row " << row;
    }
  }
  EXPECT_FLOAT_EQ(m[3][3], 1.0f);
}

TEST(Camera, DefaultMapsOriginAndRightEdge) {
  Camera camera;
  const glm::vec4 origin = project(camera, 0.0f, 0.0f);
  EXPECT_FLOAT_EQ(origin.x, 0.0f);
  EXPECT_FLOAT_EQ(origin.y, 0.0f);
  // Depth lands inside [0, 1].
  EXPECT_GE(origin.z, 0.0f);
  EXPECT_LE(origin.z, 1.0f);

  const glm::vec4 right = project(camera, 1.0f, 0.0f);
  EXPECT_FLOAT_EQ(right.x, 1.0f);
  EXPECT_FLOAT_EQ(right.y, 0.0f);
}

TEST(Camera, AspectWidensHorizontalExtent) {
  Camera camera;
  camera.setViewportSize(1600, 800);
  EXPECT_FLOAT_EQ(camera.aspectRatio, 2.0f);
  EXPECT_FLOAT_EQ(project(camera, 2.0f, 0.0f).x, 1.0f);
  EXPECT_FLOAT_EQ(project(camera, 0.0f, 1.0f).y, 1.0f);
}

TEST(Camera, ZeroHeightKeepsAspect) {
  Camera camera;
  camera.setViewportSize(300, 200);
  camera.setViewportSize(800, 0);
  EXPECT_FLOAT_EQ(camera.aspectRatio, 1.5f);
}

TEST(Camera, ZoomAndPan) {
  Camera camera;
  camera.zoom = 2.0f;
  EXPECT_FLOAT_EQ(project(camera, 0.5f, 0.0f).x, 1.0f);

  camera.zoom = 1.0f;
  camera.position = {0.5f, -0.25f};
  const glm::vec4 p = project(camera, 0.5f, -0.25f);
  EXPECT_NEAR(p.x, 0.0f, 1e-6f);
  EXPECT_NEAR(p.y, 0.0f, 1e-6f);
}

TEST(Camera, ZoomByClamps) {
  Camera camera;
  camera.zoomBy(1.1f);
  EXPECT_FLOAT_EQ(camera.zoom, 1.1f);
  camera.zoomBy(100.0f);
  EXPECT_FLOAT_EQ(camera.zoom, Camera::kMaxZoom);
  camera.zoomBy(1e-6f);
  EXPECT_FLOAT_EQ(camera.zoom, Camera::kMinZoom);
  camera.zoomBy(-2.0f);
  EXPECT_FLOAT_EQ(camera.zoom, Camera::kMinZoom);
}

TEST(Camera, PanByPixelsFollowsDrag) {
  Camera camera;
  // 800 px tall viewport shows 2 world units at zoom 1.
  camera.panByPixels(400.0f, 400.0f, 800);
  EXPECT_FLOAT_EQ(camera.position.x, -1.0f);
  EXPECT_FLOAT_EQ(camera.position.y, 1.0f);

  camera.zoom = 2.0f;
  camera.panByPixels(-400.0f, 0.0f, 800);
  EXPECT_FLOAT_EQ(camera.position.x, -0.5f);

  camera.panByPixels(100.0f, 100.0f, 0);
  EXPECT_FLOAT_EQ(camera.position.x, -0.5f);
}
