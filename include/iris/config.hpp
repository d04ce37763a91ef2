#pragma once

#include <webgpu/webgpu.h>

#include <array>
#include <string>

namespace iris {

// Runtime knobs for the viewport core. Defaults match a desktop host that draws
// with OpenGL, so the GPU core stays on a different backend family.
struct ViewportConfig {
  WGPUBackendType backend = defaultBackend();
  bool highPerformance = true;
  // Background the render pass clears to (RGBA, linear).
  std::array<double, 4> clearColor{0.051, 0.051, 0.051, 1.0};

  static WGPUBackendType defaultBackend();

  // Reads IRIS_BACKEND and IRIS_LOW_POWER. Verbosity is verboseLogging().
  // Throws std::invalid_argument on an unknown backend name.
  static ViewportConfig fromEnvironment();
};

// Accepts vulkan, metal, d3d12, d3d11, opengl, null or auto (case-sensitive).
WGPUBackendType parseBackend(const std::string& name);
const char* backendName(WGPUBackendType backend);

// True when IRIS_VIEWPORT_VERBOSE is set.
bool verboseLogging();

}  // namespace iris
