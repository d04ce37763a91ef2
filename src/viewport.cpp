#include "iris/viewport.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace iris {

const char* toString(ViewportState state) {
  switch (state) {
    case ViewportState::Uninitialized:
      return "uninitialized";
    case ViewportState::Ready:
      return "ready";
    case ViewportState::Displaying:
      return "displaying";
  }
  return "unknown";
}

Viewport::Viewport(PresentFn present, const ViewportConfig& config, DecodeFn decode)
    : config_(config),
      present_(std::move(present)),
      uploads_(runner_, std::move(decode),
               [this](DecodedImage image) { install_(std::move(image)); }) {
  GraphicsContext::initialize(runner_, config_, [this](std::shared_ptr<GraphicsContext> gpu) {
    onContextReady_(std::move(gpu));
  });
}

Viewport::~Viewport() {
  // Queued steps point back into this object; drop them (joining any decode
  // still running) before members go away.
  runner_.clear();
}

std::uint64_t Viewport::loadImage(const std::filesystem::path& path) {
  return uploads_.load(path);
}

void Viewport::onContextReady_(std::shared_ptr<GraphicsContext> gpu) {
  gpu_ = std::move(gpu);
  // Real size arrives with the next tick.
  renderer_ = std::make_unique<FrameRenderer>(gpu_, 1, 1, config_.clearColor);
  if (pending_) {
    try {
      renderer_->installImage(*pending_);
    } catch (const std::invalid_argument& e) {
      std::cerr << "Failed to install image: " << e.what() << "\n";
    }
    pending_.reset();
  }
  if (verboseLogging()) std::cout << "Viewport " << toString(state()) << std::endl;
}

void Viewport::install_(DecodedImage image) {
  if (!renderer_) {
    pending_ = std::move(image);
    return;
  }
  renderer_->installImage(image);
  if (verboseLogging()) {
    std::cout << "Viewport " << toString(state()) << " " << image.width << "x" << image.height
              << " image" << std::endl;
  }
}

ViewportState Viewport::state() const {
  if (!renderer_) return ViewportState::Uninitialized;
  return renderer_->hasImage() ? ViewportState::Displaying : ViewportState::Ready;
}

void Viewport::onTick(std::uint32_t width, std::uint32_t height) {
  runner_.runPending();
  if (!renderer_) return;
  if (width == 0 || height == 0) return;

  if (width != renderer_->width() || height != renderer_->height()) {
    camera_.setViewportSize(width, height);
    renderer_->resize(width, height);
  }

  const PixelBuffer frame = renderer_->render(camera_);
  ++frames_;
  if (present_) present_(frame);
}

}  // namespace iris
