#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>

#include "iris/frame_renderer.hpp"

using iris::computeImageScale;
using iris::paddedBytesPerRow;

TEST(FrameLayout, RowStrideRoundsUpTo256) {
  EXPECT_EQ(paddedBytesPerRow(1), 256u);
  EXPECT_EQ(paddedBytesPerRow(64), 256u);
  EXPECT_EQ(paddedBytesPerRow(65), 512u);
  EXPECT_EQ(paddedBytesPerRow(100), 512u);
  EXPECT_EQ(paddedBytesPerRow(200), 1024u);
  EXPECT_EQ(paddedBytesPerRow(1920), 7680u);
}

TEST(FrameLayout, RowStrideIsMinimalAlignedCover) {
  for (std::uint32_t w = 1; w <= 2048; ++w) {
    const std::uint32_t stride = paddedBytesPerRow(w);
    ASSERT_EQ(stride % iris::kCopyRowAlignment, 0u) << "width " << w;
    ASSERT_GE(stride, w * 4) << "width " << w;
    ASSERT_LT(stride - w * 4, iris::kCopyRowAlignment) << "width " << w;
  }
}

TEST(FrameLayout, ImageScaleNormalizesLongerAxis) {
  const glm::vec2 wide = computeImageScale(200.0f, 100.0f);
  EXPECT_FLOAT_EQ(wide.x, 1.0f);
  EXPECT_FLOAT_EQ(wide.y, 0.5f);

  const glm::vec2 tall = computeImageScale(100.0f, 400.0f);
  EXPECT_FLOAT_EQ(tall.x, 0.25f);
  EXPECT_FLOAT_EQ(tall.y, 1.0f);

  const glm::vec2 square = computeImageScale(64.0f, 64.0f);
  EXPECT_FLOAT_EQ(square.x, 1.0f);
  EXPECT_FLOAT_EQ(square.y, 1.0f);
}

TEST(FrameLayout, ImageScaleStaysInUnitRangeAndKeepsAspect) {
  const float sizes[] = {1.0f, 3.0f, 17.0f, 640.0f, 1080.0f, 4096.0f};
  for (float w : sizes) {
    for (float h : sizes) {
      const glm::vec2 s = computeImageScale(w, h);
      EXPECT_GT(s.x, 0.0f);
      EXPECT_LE(s.x, 1.0f);
      EXPECT_GT(s.y, 0.0f);
      EXPECT_LE(s.y, 1.0f);
      EXPECT_NEAR(s.x / s.y, w / h, 1e-3f * (w / h));
    }
  }
}

TEST(FrameLayout, ImageScaleRejectsEmpty) {
  EXPECT_THROW(computeImageScale(0.0f, 10.0f), std::invalid_argument);
  EXPECT_THROW(computeImageScale(10.0f, 0.0f), std::invalid_argument);
}

TEST(FrameLayout, UniformBlockLayout) {
  EXPECT_EQ(sizeof(iris::UniformBlock), 80u);
  EXPECT_EQ(offsetof(iris::UniformBlock, imageScale), 64u);
  EXPECT_EQ(alignof(iris::UniformBlock), 16u);
}

TEST(FrameLayout, UniformBlockFromCameraAndDims) {
  iris::Camera camera;
  camera.setViewportSize(400, 200);
  camera.zoom = 2.0f;

  const iris::UniformBlock block = iris::makeUniformBlock(camera, {300.0f, 100.0f});
  const glm::mat4 expected = camera.buildViewProjectionMatrix();
  for (int col = 0; col < 4; ++col) {
    for (int row = 0; row < 4; ++row) {
      EXPECT_FLOAT_EQ(block.viewProjection[col * 4 + row], expected[col][row]);
    }
  }
  EXPECT_FLOAT_EQ(block.imageScale[0], 1.0f);
  EXPECT_FLOAT_EQ(block.imageScale[1], 1.0f / 3.0f);
  EXPECT_FLOAT_EQ(block.padding[0], 0.0f);
  EXPECT_FLOAT_EQ(block.padding[1], 0.0f);
}
