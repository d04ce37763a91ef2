#include "iris/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace iris {

WGPUBackendType ViewportConfig::defaultBackend() {
  // Stay off OpenGL: the host window draws with it, and sharing the context
  // type with the host surface upsets some drivers.
#if defined(__APPLE__)
  return WGPUBackendType_Metal;
#elif defined(_WIN32)
  return WGPUBackendType_D3D12;
#else
  return WGPUBackendType_Vulkan;
#endif
}

ViewportConfig ViewportConfig::fromEnvironment() {
  ViewportConfig config;
  if (const char* backend = std::getenv("IRIS_BACKEND")) {
    config.backend = parseBackend(backend);
  }
  config.highPerformance = std::getenv("IRIS_LOW_POWER") == nullptr;
  return config;
}

WGPUBackendType parseBackend(const std::string& name) {
  if (name == "vulkan") return WGPUBackendType_Vulkan;
  if (name == "metal") return WGPUBackendType_Metal;
  if (name == "d3d12") return WGPUBackendType_D3D12;
  if (name == "d3d11") return WGPUBackendType_D3D11;
  if (name == "opengl") return WGPUBackendType_OpenGL;
  if (name == "null") return WGPUBackendType_Null;
  if (name == "auto") return WGPUBackendType_Undefined;
  throw std::invalid_argument("unknown IRIS_BACKEND value: " + name);
}

const char* backendName(WGPUBackendType backend) {
  switch (backend) {
    case WGPUBackendType_Vulkan:
      return "vulkan";
    case WGPUBackendType_Metal:
      return "metal";
    case WGPUBackendType_D3D12:
      return "d3d12";
    case WGPUBackendType_D3D11:
      return "d3d11";
    case WGPUBackendType_OpenGL:
      return "opengl";
    case WGPUBackendType_OpenGLES:
      return "opengles";
    case WGPUBackendType_Null:
      return "null";
    case WGPUBackendType_WebGPU:
      return "webgpu";
    default:
      return "auto";
  }
}

bool verboseLogging() { return std::getenv("IRIS_VIEWPORT_VERBOSE") != nullptr; }

}  // namespace iris
