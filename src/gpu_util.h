#pragma once

#include <webgpu/webgpu.h>

#include <string>

namespace iris {

inline WGPUStringView makeStringView(const char* s) {
  WGPUStringView sv{};
  sv.data = s;
  sv.length = WGPU_STRLEN;  // null-terminated
  return sv;
}

std::string toString(WGPUStringView sv);

WGPUShaderModule createShaderModuleFromWGSL(WGPUDevice device, const char* code,
                                            const char* label);

}  // namespace iris
