#include "gpu_util.h"

namespace iris {

std::string toString(WGPUStringView sv) {
  if (!sv.data) return {};
  if (sv.length == WGPU_STRLEN) return std::string(sv.data);
  return std::string(sv.data, sv.length);
}

WGPUShaderModule createShaderModuleFromWGSL(WGPUDevice device, const char* code,
                                            const char* label) {
  WGPUShaderSourceWGSL wgsl{};
  wgsl.chain.sType = WGPUSType_ShaderSourceWGSL;
  wgsl.code = makeStringView(code);

  WGPUShaderModuleDescriptor desc{};
  desc.nextInChain = reinterpret_cast<WGPUChainedStruct*>(&wgsl);
  desc.label = makeStringView(label);

  return wgpuDeviceCreateShaderModule(device, &desc);
}

}  // namespace iris
