#pragma once

#include "brush/render_device.hpp"
#include <memory>

// This header is only usable when BRUSH_HAS_GL is defined.
// Including it without GL support will cause a compile error.

#if !BRUSH_HAS_GL
#error "GL device not available. Build with -DBRUSH_ENABLE_GL=ON"
#endif

namespace brush {

/**
 * GL-specific RenderDevice factory functions.
 *
 * Usage:
 *   #include <brush/gpu/gl/gl_device.hpp>
 *   brush::Context ctx(RenderDevices::MakeGL());
 */
namespace RenderDevices {

/**
 * Create a RenderDevice bound to the currently active OpenGL context.
 * Host must have created and made current a GL 3.3 core context before
 * calling, and keep it current for every call on the device.
 * Returns nullptr if no GL context is current or GL init fails.
 */
std::shared_ptr<RenderDevice> MakeGL(u32 copyAlignment = 256);

} // namespace RenderDevices

} // namespace brush
