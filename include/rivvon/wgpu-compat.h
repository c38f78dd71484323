#pragma once

// Helpers for the Dawn-style webgpu.h API (WGPUStringView, callback infos).

#include <webgpu/webgpu.h>

// Process pending GPU work and callbacks
#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Render pass color attachment uses clearValue
#define WGPU_COLOR_ATTACHMENT_CLEAR(attachment, r, g, b, a)                    \
  (attachment).clearValue = {(r), (g), (b), (a)}

#define WGPU_MIPMAP_FILTER_LINEAR WGPUMipmapFilterMode_Linear
