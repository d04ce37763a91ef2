#include "iris/graphics_context.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "gpu_util.h"

namespace iris {

namespace {

struct AdapterSlot {
  WGPUAdapter adapter{};
  std::string message;
  bool done = false;
};

struct DeviceSlot {
  WGPUDevice device{};
  std::string message;
  bool done = false;
};

void onAdapter(WGPURequestAdapterStatus status, WGPUAdapter adapter, WGPUStringView message,
               void* userdata1, void* /*userdata2*/) {
  auto* slot = static_cast<AdapterSlot*>(userdata1);
  if (status == WGPURequestAdapterStatus_Success) slot->adapter = adapter;
  slot->message = toString(message);
  slot->done = true;
}

void onDevice(WGPURequestDeviceStatus status, WGPUDevice device, WGPUStringView message,
              void* userdata1, void* /*userdata2*/) {
  auto* slot = static_cast<DeviceSlot*>(userdata1);
  if (status == WGPURequestDeviceStatus_Success) slot->device = device;
  slot->message = toString(message);
  slot->done = true;
}

void onUncapturedError(WGPUDevice const* /*device*/, WGPUErrorType type, WGPUStringView message,
                       void* /*userdata1*/, void* /*userdata2*/) {
  std::cerr << "WebGPU error (" << static_cast<int>(type) << "): " << toString(message) << "\n";
}

void onDeviceLost(WGPUDevice const* /*device*/, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* /*userdata1*/, void* /*userdata2*/) {
  // Both are the normal teardown path.
  if (reason == WGPUDeviceLostReason_Destroyed ||
      reason == WGPUDeviceLostReason_CallbackCancelled) {
    return;
  }
  std::cerr << "WebGPU device lost (" << static_cast<int>(reason) << "): " << toString(message)
            << "\n";
}

}  // namespace

// Adapter -> device acquisition as a resumable runner step.
class ContextAcquisition {
 public:
  explicit ContextAcquisition(const ViewportConfig& config)
      : config_(config), context_(new GraphicsContext()) {}

  Poll poll() {
    switch (stage_) {
      case Stage::Start:
        requestAdapter_();
        stage_ = Stage::Adapter;
        return Poll::Pending;
      case Stage::Adapter:
        context_->processEvents();
        if (!adapter_.done) return Poll::Pending;
        if (!adapter_.adapter) {
          throw std::runtime_error(std::string("no suitable GPU adapter for backend ") +
                                   backendName(config_.backend) + ": " + adapter_.message);
        }
        context_->adapter_ = adapter_.adapter;
        describeAdapter_();
        requestDevice_();
        stage_ = Stage::Device;
        return Poll::Pending;
      case Stage::Device:
        context_->processEvents();
        if (!device_.done) return Poll::Pending;
        if (!device_.device) {
          throw std::runtime_error("failed to create GPU device: " + device_.message);
        }
        context_->device_ = device_.device;
        context_->queue_ = wgpuDeviceGetQueue(context_->device_);
        if (!context_->queue_) throw std::runtime_error("GPU device has no queue");
        readLimits_();
        stage_ = Stage::Done;
        return Poll::Ready;
      case Stage::Done:
        return Poll::Ready;
    }
    return Poll::Ready;
  }

  std::shared_ptr<GraphicsContext> context() const { return context_; }

 private:
  enum class Stage { Start, Adapter, Device, Done };

  void requestAdapter_() {
    WGPUInstanceDescriptor desc{};
    context_->instance_ = wgpuCreateInstance(&desc);
    if (!context_->instance_) throw std::runtime_error("wgpuCreateInstance failed");

    WGPURequestAdapterOptions opt{};
    opt.compatibleSurface = nullptr;  // offscreen only
    opt.backendType = config_.backend;
    opt.powerPreference = config_.highPerformance ? WGPUPowerPreference_HighPerformance
                                                  : WGPUPowerPreference_LowPower;

    WGPURequestAdapterCallbackInfo cb{};
    cb.mode = WGPUCallbackMode_AllowProcessEvents;
    cb.callback = onAdapter;
    cb.userdata1 = &adapter_;
    wgpuInstanceRequestAdapter(context_->instance_, &opt, cb);
  }

  void describeAdapter_() {
    WGPUAdapterInfo info{};
    if (wgpuAdapterGetInfo(context_->adapter_, &info) == WGPUStatus_Success) {
      context_->adapterName_ = toString(info.device);
      context_->backend_ = info.backendType;
      wgpuAdapterInfoFreeMembers(info);
    }
    std::cout << "Initializing GPU on: " << context_->adapterName_ << " ("
              << backendName(context_->backend_) << ")" << std::endl;
  }

  void readLimits_() {
    WGPULimits limits{};
    if (wgpuDeviceGetLimits(context_->device_, &limits) != WGPUStatus_Success) {
      throw std::runtime_error("failed to query GPU device limits");
    }
    context_->maxTextureDimension2D_ = limits.maxTextureDimension2D;
    if (verboseLogging()) {
      std::cout << "Max texture dimension: " << limits.maxTextureDimension2D << std::endl;
    }
  }

  void requestDevice_() {
    WGPUDeviceDescriptor desc{};
    desc.label = makeStringView("iris device");
    desc.uncapturedErrorCallbackInfo.callback = onUncapturedError;
    desc.deviceLostCallbackInfo.mode = WGPUCallbackMode_AllowProcessEvents;
    desc.deviceLostCallbackInfo.callback = onDeviceLost;

    WGPURequestDeviceCallbackInfo cb{};
    cb.mode = WGPUCallbackMode_AllowProcessEvents;
    cb.callback = onDevice;
    cb.userdata1 = &device_;
    wgpuAdapterRequestDevice(context_->adapter_, &desc, cb);
  }

  ViewportConfig config_;
  // Callback targets; declared before context_ so they outlive the instance.
  AdapterSlot adapter_;
  DeviceSlot device_;
  Stage stage_ = Stage::Start;
  std::shared_ptr<GraphicsContext> context_;
};

void GraphicsContext::initialize(TaskRunner& runner, const ViewportConfig& config,
                                 ReadyFn onReady) {
  auto acquisition = std::make_shared<ContextAcquisition>(config);
  runner.post([acquisition, onReady = std::move(onReady)]() {
    if (acquisition->poll() == Poll::Pending) return Poll::Pending;
    if (onReady) onReady(acquisition->context());
    return Poll::Ready;
  });
}

std::shared_ptr<GraphicsContext> GraphicsContext::create(const ViewportConfig& config) {
  ContextAcquisition acquisition(config);
  while (acquisition.poll() == Poll::Pending) {
  }
  return acquisition.context();
}

GraphicsContext::~GraphicsContext() {
  if (queue_) wgpuQueueRelease(queue_);
  if (device_) wgpuDeviceRelease(device_);
  if (adapter_) wgpuAdapterRelease(adapter_);
  if (instance_) wgpuInstanceRelease(instance_);
}

void GraphicsContext::processEvents() const {
  if (instance_) wgpuInstanceProcessEvents(instance_);
}

void GraphicsContext::waitFor(const bool& done) const {
  while (!done) {
    processEvents();
  }
}

}  // namespace iris
