#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>

#include "iris/camera.hpp"
#include "iris/config.hpp"
#include "iris/frame_renderer.hpp"
#include "iris/graphics_context.hpp"
#include "iris/image.hpp"
#include "iris/image_upload_pipeline.hpp"
#include "iris/task_runner.hpp"

namespace iris {

enum class ViewportState {
  Uninitialized,  // no GPU context yet
  Ready,          // context present, nothing loaded
  Displaying,     // an image is installed
};

const char* toString(ViewportState state);

// Pannable, zoomable single-image view. The host calls onTick once per display
// refresh from the thread that owns the GPU; every GPU call happens inside
// onTick. Rendered frames go to the present callback.
class Viewport {
 public:
  explicit Viewport(PresentFn present,
                    const ViewportConfig& config = ViewportConfig::fromEnvironment(),
                    DecodeFn decode = decodeImageFile);
  ~Viewport();
  Viewport(const Viewport&) = delete;
  Viewport& operator=(const Viewport&) = delete;

  // Starts an asynchronous load. The image shows up on a later tick; a failed
  // decode leaves the current image in place. Returns the request token.
  std::uint64_t loadImage(const std::filesystem::path& path);

  // Pumps pending async work, then (once the GPU is ready) resizes if needed,
  // renders, reads back and presents one frame. A zero width or height skips
  // the frame. GPU initialization or readback failures throw.
  void onTick(std::uint32_t width, std::uint32_t height);

  ViewportState state() const;

  // Pan and zoom input writes here directly.
  Camera& camera() { return camera_; }
  const Camera& camera() const { return camera_; }

  std::uint64_t frameCount() const { return frames_; }
  const FrameRenderer* renderer() const { return renderer_.get(); }
  const ImageUploadPipeline& uploads() const { return uploads_; }

 private:
  void onContextReady_(std::shared_ptr<GraphicsContext> gpu);
  void install_(DecodedImage image);

  ViewportConfig config_;
  PresentFn present_;
  TaskRunner runner_;
  Camera camera_;
  std::shared_ptr<GraphicsContext> gpu_;
  std::unique_ptr<FrameRenderer> renderer_;
  // Decoded before the GPU was ready; installed when it is.
  std::optional<DecodedImage> pending_;
  ImageUploadPipeline uploads_;
  std::uint64_t frames_ = 0;
};

}  // namespace iris
