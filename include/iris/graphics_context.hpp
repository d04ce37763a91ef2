#pragma once

#include <webgpu/webgpu.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "iris/config.hpp"
#include "iris/task_runner.hpp"

namespace iris {

// Owns the WebGPU instance, adapter, device and queue. One per viewport; all
// calls on it and on anything created from it happen on the runner's thread.
class GraphicsContext {
 public:
  using ReadyFn = std::function<void(std::shared_ptr<GraphicsContext>)>;

  // Posts adapter and device acquisition onto runner. onReady fires from a
  // later runPending() pass. Acquisition failure throws std::runtime_error out
  // of that pass; there is no fallback.
  static void initialize(TaskRunner& runner, const ViewportConfig& config, ReadyFn onReady);

  // Blocking variant of initialize().
  static std::shared_ptr<GraphicsContext> create(const ViewportConfig& config);

  ~GraphicsContext();
  GraphicsContext(const GraphicsContext&) = delete;
  GraphicsContext& operator=(const GraphicsContext&) = delete;

  WGPUInstance instance() const { return instance_; }
  WGPUDevice device() const { return device_; }
  WGPUQueue queue() const { return queue_; }
  WGPUTextureFormat outputFormat() const { return outputFormat_; }
  WGPUBackendType backend() const { return backend_; }
  const std::string& adapterName() const { return adapterName_; }
  // Largest width or height a 2D texture may have on this device.
  std::uint32_t maxTextureDimension2D() const { return maxTextureDimension2D_; }

  // Dispatches completed WebGPU callbacks (AllowProcessEvents mode).
  void processEvents() const;

  // Processes events until done becomes true. Only for callbacks that are
  // guaranteed to fire.
  void waitFor(const bool& done) const;

 private:
  friend class ContextAcquisition;
  GraphicsContext() = default;

  WGPUInstance instance_{};
  WGPUAdapter adapter_{};
  WGPUDevice device_{};
  WGPUQueue queue_{};
  WGPUTextureFormat outputFormat_{WGPUTextureFormat_RGBA8Unorm};
  WGPUBackendType backend_{WGPUBackendType_Undefined};
  std::string adapterName_;
  std::uint32_t maxTextureDimension2D_ = 0;
};

}  // namespace iris
