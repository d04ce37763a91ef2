#include "iris/frame_renderer.hpp"

#include <glm/gtc/type_ptr.hpp>

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "gpu_util.h"

namespace iris {

namespace {

// Quad in [-1,1]^2 scaled to the image's world extent, then through the camera.
// POS has Y pointing up so that flipping (POS*0.5+0.5).y gives top-row-first UVs.
constexpr const char* kImageShader = R"WGSL(
struct Uniforms {
  view_proj : mat4x4<f32>,
  image_scale : vec2<f32>,
  _pad : vec2<f32>,
};
@group(0) @binding(0) var<uniform> U : Uniforms;
@group(0) @binding(1) var texImg : texture_2d<f32>;
@group(0) @binding(2) var texSmp : sampler;

struct VSOut { @builtin(position) pos : vec4<f32>, @location(0) uv : vec2<f32>, };

@vertex
fn vs_main(@builtin(vertex_index) vid : u32) -> VSOut {
  var POS = array<vec2<f32>, 6>(
    vec2<f32>(-1.0,  1.0), vec2<f32>( 1.0,  1.0), vec2<f32>( 1.0, -1.0),
    vec2<f32>(-1.0,  1.0), vec2<f32>( 1.0, -1.0), vec2<f32>(-1.0, -1.0)
  );
  let world = POS[vid] * U.image_scale;
  var o : VSOut;
  o.pos = U.view_proj * vec4<f32>(world, 0.0, 1.0);
  let uv_raw = (POS[vid] * 0.5) + vec2<f32>(0.5, 0.5);
  o.uv = vec2<f32>(uv_raw.x, 1.0 - uv_raw.y);
  return o;
}

@fragment
fn fs_main(in : VSOut) -> @location(0) vec4<f32> {
  return textureSample(texImg, texSmp, in.uv);
}
)WGSL";

constexpr WGPUTextureFormat kImageFormat = WGPUTextureFormat_RGBA8UnormSrgb;

WGPUTextureView createDefaultView(WGPUTexture texture, WGPUTextureFormat format) {
  WGPUTextureViewDescriptor vdesc{};
  vdesc.dimension = WGPUTextureViewDimension_2D;
  vdesc.format = format;
  vdesc.baseMipLevel = 0;
  vdesc.mipLevelCount = 1;
  vdesc.baseArrayLayer = 0;
  vdesc.arrayLayerCount = 1;
  vdesc.aspect = WGPUTextureAspect_All;
  return wgpuTextureCreateView(texture, &vdesc);
}

struct MapResult {
  WGPUMapAsyncStatus status{};
  std::string message;
  bool done = false;
};

void onBufferMapped(WGPUMapAsyncStatus status, WGPUStringView message, void* userdata1,
                    void* /*userdata2*/) {
  auto* result = static_cast<MapResult*>(userdata1);
  result->status = status;
  result->message = toString(message);
  result->done = true;
}

}  // namespace

std::uint32_t paddedBytesPerRow(std::uint32_t width) {
  const std::uint32_t unpadded = width * kBytesPerPixel;
  const std::uint32_t padding = (kCopyRowAlignment - unpadded % kCopyRowAlignment) %
                                kCopyRowAlignment;
  return unpadded + padding;
}

glm::vec2 computeImageScale(float width, float height) {
  if (!(width > 0.0f) || !(height > 0.0f)) {
    throw std::invalid_argument("computeImageScale: image dimensions must be positive");
  }
  const float aspect = width / height;
  if (aspect > 1.0f) return {1.0f, 1.0f / aspect};  // wide
  return {aspect, 1.0f};                            // tall or square
}

UniformBlock makeUniformBlock(const Camera& camera, glm::vec2 imageDims) {
  UniformBlock block{};
  const glm::mat4 viewProj = camera.buildViewProjectionMatrix();
  std::memcpy(block.viewProjection, glm::value_ptr(viewProj), sizeof(block.viewProjection));
  const glm::vec2 scale = computeImageScale(imageDims.x, imageDims.y);
  block.imageScale[0] = scale.x;
  block.imageScale[1] = scale.y;
  return block;
}

// The texture and bind group of one uploaded image. Replaced, never mutated.
struct FrameRenderer::ImageResource {
  WGPUTexture texture{};
  WGPUTextureView view{};
  WGPUBindGroup bindGroup{};
  glm::vec2 dims{1.0f, 1.0f};

  ImageResource() = default;
  ImageResource(const ImageResource&) = delete;
  ImageResource& operator=(const ImageResource&) = delete;
  ~ImageResource() {
    if (bindGroup) wgpuBindGroupRelease(bindGroup);
    if (view) wgpuTextureViewRelease(view);
    if (texture) wgpuTextureRelease(texture);
  }
};

// Render texture plus its CPU-mappable mirror.
struct FrameRenderer::OutputTarget {
  WGPUTexture texture{};
  WGPUTextureView view{};
  WGPUBuffer readback{};
  std::uint32_t width = 0;
  std::uint32_t height = 0;
  std::uint32_t rowStride = 0;

  OutputTarget() = default;
  OutputTarget(const OutputTarget&) = delete;
  OutputTarget& operator=(const OutputTarget&) = delete;
  ~OutputTarget() {
    if (readback) wgpuBufferRelease(readback);
    if (view) wgpuTextureViewRelease(view);
    if (texture) wgpuTextureRelease(texture);
  }

  std::uint64_t byteSize() const { return static_cast<std::uint64_t>(rowStride) * height; }
};

FrameRenderer::FrameRenderer(std::shared_ptr<GraphicsContext> gpu, std::uint32_t width,
                             std::uint32_t height, const std::array<double, 4>& clearColor)
    : gpu_(std::move(gpu)), clearColor_(clearColor) {
  if (!gpu_) throw std::invalid_argument("FrameRenderer: null graphics context");
  if (width == 0 || height == 0) {
    throw std::invalid_argument("FrameRenderer: output size must be positive");
  }

  WGPUBufferDescriptor bd{};
  bd.label = makeStringView("iris uniforms");
  bd.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
  bd.size = sizeof(UniformBlock);
  uniformBuffer_ = wgpuDeviceCreateBuffer(gpu_->device(), &bd);

  WGPUSamplerDescriptor sampDesc{};
  sampDesc.addressModeU = WGPUAddressMode_ClampToEdge;
  sampDesc.addressModeV = WGPUAddressMode_ClampToEdge;
  sampDesc.addressModeW = WGPUAddressMode_ClampToEdge;
  sampDesc.magFilter = WGPUFilterMode_Linear;
  sampDesc.minFilter = WGPUFilterMode_Linear;
  sampDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
  // Zero is rejected by validation.
  sampDesc.maxAnisotropy = 1;
  sampler_ = wgpuDeviceCreateSampler(gpu_->device(), &sampDesc);

  createPipeline_();
  target_ = createTarget_(width, height);

  // Transparent placeholder so every frame binds and draws; blending leaves the background.
  const std::uint8_t blank[kBytesPerPixel] = {0, 0, 0, 0};
  image_ = createImageResource_(1, 1, blank);
}

FrameRenderer::~FrameRenderer() {
  image_.reset();
  target_.reset();
  if (sampler_) wgpuSamplerRelease(sampler_);
  if (uniformBuffer_) wgpuBufferRelease(uniformBuffer_);
  if (pipeline_) wgpuRenderPipelineRelease(pipeline_);
  if (pipelineLayout_) wgpuPipelineLayoutRelease(pipelineLayout_);
  if (bindGroupLayout_) wgpuBindGroupLayoutRelease(bindGroupLayout_);
  if (shaderModule_) wgpuShaderModuleRelease(shaderModule_);
}

void FrameRenderer::createPipeline_() {
  shaderModule_ = createShaderModuleFromWGSL(gpu_->device(), kImageShader, "iris image shader");

  // uniforms + texture + sampler
  WGPUBindGroupLayoutEntry bgl[3]{};
  bgl[0].binding = 0;
  bgl[0].visibility = WGPUShaderStage_Vertex;
  bgl[0].buffer.type = WGPUBufferBindingType_Uniform;
  bgl[0].buffer.minBindingSize = sizeof(UniformBlock);

  bgl[1].binding = 1;
  bgl[1].visibility = WGPUShaderStage_Fragment;
  bgl[1].texture.sampleType = WGPUTextureSampleType_Float;
  bgl[1].texture.viewDimension = WGPUTextureViewDimension_2D;
  bgl[1].texture.multisampled = false;

  bgl[2].binding = 2;
  bgl[2].visibility = WGPUShaderStage_Fragment;
  bgl[2].sampler.type = WGPUSamplerBindingType_Filtering;

  WGPUBindGroupLayoutDescriptor bglDesc{};
  bglDesc.label = makeStringView("iris bind group layout");
  bglDesc.entryCount = 3;
  bglDesc.entries = bgl;
  bindGroupLayout_ = wgpuDeviceCreateBindGroupLayout(gpu_->device(), &bglDesc);

  WGPUPipelineLayoutDescriptor plDesc{};
  plDesc.bindGroupLayoutCount = 1;
  plDesc.bindGroupLayouts = &bindGroupLayout_;
  pipelineLayout_ = wgpuDeviceCreatePipelineLayout(gpu_->device(), &plDesc);

  WGPUBlendState blend{};
  blend.color.operation = WGPUBlendOperation_Add;
  blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
  blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
  blend.alpha.operation = WGPUBlendOperation_Add;
  blend.alpha.srcFactor = WGPUBlendFactor_One;
  blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;

  WGPUColorTargetState colorTarget{};
  colorTarget.format = gpu_->outputFormat();
  colorTarget.blend = &blend;
  // The zero default disables all writes.
  colorTarget.writeMask = WGPUColorWriteMask_All;

  WGPUFragmentState frag{};
  frag.module = shaderModule_;
  frag.entryPoint = makeStringView("fs_main");
  frag.targetCount = 1;
  frag.targets = &colorTarget;

  WGPURenderPipelineDescriptor pDesc{};
  pDesc.label = makeStringView("iris image pipeline");
  pDesc.layout = pipelineLayout_;
  pDesc.vertex.module = shaderModule_;
  pDesc.vertex.entryPoint = makeStringView("vs_main");
  pDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
  pDesc.primitive.stripIndexFormat = WGPUIndexFormat_Undefined;
  pDesc.primitive.frontFace = WGPUFrontFace_CCW;
  pDesc.primitive.cullMode = WGPUCullMode_None;
  pDesc.multisample.count = 1;
  pDesc.multisample.mask = ~0u;
  pDesc.multisample.alphaToCoverageEnabled = false;
  pDesc.fragment = &frag;

  pipeline_ = wgpuDeviceCreateRenderPipeline(gpu_->device(), &pDesc);
  if (!pipeline_) throw std::runtime_error("failed to create image render pipeline");
}

std::unique_ptr<FrameRenderer::OutputTarget> FrameRenderer::createTarget_(
    std::uint32_t width, std::uint32_t height) const {
  auto target = std::make_unique<OutputTarget>();
  target->width = width;
  target->height = height;
  target->rowStride = paddedBytesPerRow(width);

  WGPUTextureDescriptor td{};
  td.label = makeStringView("iris output texture");
  td.dimension = WGPUTextureDimension_2D;
  td.size = {width, height, 1};
  td.mipLevelCount = 1;
  td.sampleCount = 1;
  td.format = gpu_->outputFormat();
  td.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_CopySrc;
  target->texture = wgpuDeviceCreateTexture(gpu_->device(), &td);
  target->view = createDefaultView(target->texture, td.format);

  WGPUBufferDescriptor bd{};
  bd.label = makeStringView("iris readback buffer");
  bd.usage = WGPUBufferUsage_CopyDst | WGPUBufferUsage_MapRead;
  bd.size = target->byteSize();
  bd.mappedAtCreation = false;
  target->readback = wgpuDeviceCreateBuffer(gpu_->device(), &bd);

  if (verboseLogging()) {
    std::cout << "Output target " << width << "x" << height << ", stride " << target->rowStride
              << std::endl;
  }
  return target;
}

std::unique_ptr<FrameRenderer::ImageResource> FrameRenderer::createImageResource_(
    std::uint32_t width, std::uint32_t height, const std::uint8_t* rgba) const {
  auto next = std::make_unique<ImageResource>();
  next->dims = {static_cast<float>(width), static_cast<float>(height)};

  WGPUTextureDescriptor texDesc{};
  texDesc.label = makeStringView("iris image texture");
  texDesc.dimension = WGPUTextureDimension_2D;
  texDesc.size = {width, height, 1};
  texDesc.mipLevelCount = 1;
  texDesc.sampleCount = 1;
  texDesc.format = kImageFormat;
  texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
  next->texture = wgpuDeviceCreateTexture(gpu_->device(), &texDesc);

  WGPUTexelCopyTextureInfo dst{};
  dst.texture = next->texture;
  dst.mipLevel = 0;
  dst.origin = {0, 0, 0};
  dst.aspect = WGPUTextureAspect_All;

  // Queue writes have no 256-byte row alignment requirement.
  WGPUTexelCopyBufferLayout layout{};
  layout.offset = 0;
  layout.bytesPerRow = width * kBytesPerPixel;
  layout.rowsPerImage = height;

  WGPUExtent3D extent{width, height, 1};
  wgpuQueueWriteTexture(gpu_->queue(), &dst, rgba, static_cast<std::size_t>(width) * height * kBytesPerPixel, &layout,
                        &extent);

  next->view = createDefaultView(next->texture, kImageFormat);

  WGPUBindGroupEntry entries[3]{};
  entries[0].binding = 0;
  entries[0].buffer = uniformBuffer_;
  entries[0].offset = 0;
  entries[0].size = sizeof(UniformBlock);

  entries[1].binding = 1;
  entries[1].textureView = next->view;

  entries[2].binding = 2;
  entries[2].sampler = sampler_;

  WGPUBindGroupDescriptor bgDesc{};
  bgDesc.label = makeStringView("iris image bind group");
  bgDesc.layout = bindGroupLayout_;
  bgDesc.entryCount = 3;
  bgDesc.entries = entries;
  next->bindGroup = wgpuDeviceCreateBindGroup(gpu_->device(), &bgDesc);

  return next;
}

void FrameRenderer::installImage(const DecodedImage& image) {
  if (image.width == 0 || image.height == 0) {
    throw std::invalid_argument("installImage: empty image");
  }
  const std::size_t expected =
      static_cast<std::size_t>(image.width) * image.height * kBytesPerPixel;
  if (image.rgba.size() != expected) {
    throw std::invalid_argument("installImage: pixel buffer size does not match dimensions");
  }
  const std::uint32_t limit = gpu_->maxTextureDimension2D();
  if (image.width > limit || image.height > limit) {
    throw std::invalid_argument("installImage: " + std::to_string(image.width) + "x" +
                                std::to_string(image.height) +
                                " exceeds the device texture limit of " + std::to_string(limit));
  }

  auto next = createImageResource_(image.width, image.height, image.rgba.data());
  // Swap last: a render never sees a half-built resource.
  image_ = std::move(next);
  loaded_ = true;
}

glm::vec2 FrameRenderer::imageDims() const {
  return image_->dims;
}

glm::vec2 FrameRenderer::imageScale() const {
  const glm::vec2 dims = imageDims();
  return computeImageScale(dims.x, dims.y);
}

bool FrameRenderer::resize(std::uint32_t width, std::uint32_t height) {
  if (width == 0 || height == 0) return false;
  if (target_ && width == target_->width && height == target_->height) return false;
  // Drop the old target before allocating the new one to cap peak memory.
  target_.reset();
  target_ = createTarget_(width, height);
  ++reallocations_;
  return true;
}

std::uint32_t FrameRenderer::width() const { return target_->width; }
std::uint32_t FrameRenderer::height() const { return target_->height; }
std::uint32_t FrameRenderer::rowStride() const { return target_->rowStride; }

void FrameRenderer::encodeFrame_(WGPUCommandEncoder encoder) {
  WGPURenderPassColorAttachment color{};
  color.view = target_->view;
  // For non-3D color targets, depthSlice must be the undefined sentinel.
  color.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
  color.resolveTarget = nullptr;
  color.loadOp = WGPULoadOp_Clear;
  color.storeOp = WGPUStoreOp_Store;
  color.clearValue = {clearColor_[0], clearColor_[1], clearColor_[2], clearColor_[3]};

  WGPURenderPassDescriptor rpDesc{};
  rpDesc.label = makeStringView("iris image pass");
  rpDesc.colorAttachmentCount = 1;
  rpDesc.colorAttachments = &color;

  WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
  wgpuRenderPassEncoderSetPipeline(pass, pipeline_);
  wgpuRenderPassEncoderSetBindGroup(pass, 0, image_->bindGroup, 0, nullptr);
  // Two triangles from vertex_index; no vertex buffer.
  wgpuRenderPassEncoderDraw(pass, 6, 1, 0, 0);
  wgpuRenderPassEncoderEnd(pass);
  wgpuRenderPassEncoderRelease(pass);

  WGPUTexelCopyTextureInfo src{};
  src.texture = target_->texture;
  src.mipLevel = 0;
  src.origin = {0, 0, 0};
  src.aspect = WGPUTextureAspect_All;

  WGPUTexelCopyBufferInfo dst{};
  dst.buffer = target_->readback;
  dst.layout.offset = 0;
  dst.layout.bytesPerRow = target_->rowStride;
  dst.layout.rowsPerImage = target_->height;

  WGPUExtent3D extent{target_->width, target_->height, 1};
  wgpuCommandEncoderCopyTextureToBuffer(encoder, &src, &dst, &extent);
}

PixelBuffer FrameRenderer::render(const Camera& camera) {
  const UniformBlock uniforms = makeUniformBlock(camera, imageDims());
  wgpuQueueWriteBuffer(gpu_->queue(), uniformBuffer_, 0, &uniforms, sizeof(uniforms));

  WGPUCommandEncoderDescriptor encDesc{};
  encDesc.label = makeStringView("iris frame encoder");
  WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(gpu_->device(), &encDesc);
  encodeFrame_(encoder);

  WGPUCommandBufferDescriptor cmdDesc{};
  WGPUCommandBuffer cmd = wgpuCommandEncoderFinish(encoder, &cmdDesc);
  wgpuCommandEncoderRelease(encoder);
  wgpuQueueSubmit(gpu_->queue(), 1, &cmd);
  wgpuCommandBufferRelease(cmd);

  // One frame in flight: wait for the map before returning.
  const std::size_t size = static_cast<std::size_t>(target_->byteSize());
  MapResult mapped;
  WGPUBufferMapCallbackInfo cb{};
  cb.mode = WGPUCallbackMode_AllowProcessEvents;
  cb.callback = onBufferMapped;
  cb.userdata1 = &mapped;
  wgpuBufferMapAsync(target_->readback, WGPUMapMode_Read, 0, size, cb);
  gpu_->waitFor(mapped.done);

  if (mapped.status != WGPUMapAsyncStatus_Success) {
    throw std::runtime_error("readback map failed (" +
                             std::to_string(static_cast<int>(mapped.status)) +
                             "): " + mapped.message);
  }

  const auto* data =
      static_cast<const std::uint8_t*>(wgpuBufferGetConstMappedRange(target_->readback, 0, size));
  if (!data) {
    wgpuBufferUnmap(target_->readback);
    throw std::runtime_error("readback mapped range is null");
  }

  PixelBuffer frame;
  frame.width = target_->width;
  frame.height = target_->height;
  frame.format = PixelFormat::RGBA8;
  frame.rowStride = target_->rowStride;
  frame.bytes.assign(data, data + size);
  wgpuBufferUnmap(target_->readback);
  return frame;
}

}  // namespace iris
