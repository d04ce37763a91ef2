#pragma once

#include <webgpu/webgpu.h>

#include <glm/glm.hpp>

#include <array>
#include <cstdint>
#include <memory>

#include "iris/camera.hpp"
#include "iris/graphics_context.hpp"
#include "iris/image.hpp"

namespace iris {

// WebGPU requires bytesPerRow of a texture->buffer copy to be a multiple of 256.
constexpr std::uint32_t kCopyRowAlignment = 256;
constexpr std::uint32_t kBytesPerPixel = 4;

// width * 4 rounded up to kCopyRowAlignment.
std::uint32_t paddedBytesPerRow(std::uint32_t width);

// Quad half-extents in world units: the longer image axis becomes 1.0 and the
// aspect ratio is kept. Throws std::invalid_argument unless both are > 0.
glm::vec2 computeImageScale(float width, float height);

// Uniform buffer contents; layout must match `Uniforms` in the WGSL shader.
struct alignas(16) UniformBlock {
  float viewProjection[16];  // column-major
  float imageScale[2];
  float padding[2];
};
static_assert(sizeof(UniformBlock) == 80, "uniform block must stay 16-byte aligned");

UniformBlock makeUniformBlock(const Camera& camera, glm::vec2 imageDims);

// Draws the current image as a textured quad into an offscreen texture and
// reads it back into host memory. GPU-thread only.
class FrameRenderer {
 public:
  FrameRenderer(std::shared_ptr<GraphicsContext> gpu, std::uint32_t width, std::uint32_t height,
                const std::array<double, 4>& clearColor = {0.051, 0.051, 0.051, 1.0});
  ~FrameRenderer();
  FrameRenderer(const FrameRenderer&) = delete;
  FrameRenderer& operator=(const FrameRenderer&) = delete;

  // Uploads image into a new texture + bind group and swaps it in as the
  // current image. The previous image is released after the swap.
  // Throws std::invalid_argument on an empty or inconsistent image, or one
  // larger than the device's maxTextureDimension2D; the current image stays.
  void installImage(const DecodedImage& image);

  // False while only the built-in 1x1 placeholder is bound.
  bool hasImage() const { return loaded_; }
  // (1, 1) until an image is installed.
  glm::vec2 imageDims() const;
  glm::vec2 imageScale() const;

  // Renders one frame and blocks until its pixels are mapped and copied out.
  // Throws std::runtime_error if the readback buffer cannot be mapped.
  PixelBuffer render(const Camera& camera);

  // Recreates the output target when the size changes and both sides are > 0.
  // Returns true if a reallocation happened.
  bool resize(std::uint32_t width, std::uint32_t height);

  std::uint32_t width() const;
  std::uint32_t height() const;
  std::uint32_t rowStride() const;
  std::uint64_t reallocationCount() const { return reallocations_; }

 private:
  struct ImageResource;
  struct OutputTarget;

  void createPipeline_();
  std::unique_ptr<ImageResource> createImageResource_(std::uint32_t width, std::uint32_t height,
                                                      const std::uint8_t* rgba) const;
  std::unique_ptr<OutputTarget> createTarget_(std::uint32_t width, std::uint32_t height) const;
  void encodeFrame_(WGPUCommandEncoder encoder);

  std::shared_ptr<GraphicsContext> gpu_;
  std::array<double, 4> clearColor_;

  WGPUShaderModule shaderModule_{};
  WGPUBindGroupLayout bindGroupLayout_{};
  WGPUPipelineLayout pipelineLayout_{};
  WGPURenderPipeline pipeline_{};
  WGPUBuffer uniformBuffer_{};
  WGPUSampler sampler_{};

  std::unique_ptr<ImageResource> image_;
  bool loaded_ = false;
  std::unique_ptr<OutputTarget> target_;
  std::uint64_t reallocations_ = 0;
};

}  // namespace iris
