#pragma once

/**
 * Brush - An immediate-mode drawing pipeline for creative coding
 *
 * Usage:
 *
 *   // CPU rendering
 *   #include <brush/brush.hpp>
 *   brush::Context ctx(std::make_shared<brush::CpuDevice>());
 *   auto canvas = ctx.createCanvas(800, 600).value();
 *   brush::Sketch s(ctx, canvas);
 *   s.beginDraw();
 *   s.background(0.1f, 0.1f, 0.1f);
 *   s.fill(1, 0, 0);
 *   s.rect(10, 10, 100, 100);
 *   s.endDraw();
 *   auto pixels = ctx.readback(canvas);
 *
 *   // GPU rendering (requires #include <brush/gpu/gl/gl_device.hpp>)
 *   brush::Context ctx(brush::RenderDevices::MakeGL());
 */

// Version
#include "brush/version.hpp"

// Core types and errors
#include "brush/types.hpp"
#include "brush/error.hpp"
#include "brush/math.hpp"

// Pixel data
#include "brush/pixel_codec.hpp"
#include "brush/pixmap.hpp"

// Geometry building blocks
#include "brush/mesh.hpp"
#include "brush/tessellation.hpp"
#include "brush/transform_stack.hpp"

// Materials
#include "brush/material.hpp"

// Commands and state
#include "brush/command.hpp"
#include "brush/command_visitor.hpp"
#include "brush/render_state.hpp"

// Devices
#include "brush/render_device.hpp"
#include "brush/cpu_device.hpp"

#if BRUSH_HAS_GL
#include "brush/gpu/gl/gl_device.hpp"
#endif

// Resources
#include "brush/texture_target.hpp"
#include "brush/image.hpp"
#include "brush/geometry.hpp"
#include "brush/material_library.hpp"
#include "brush/render_layers.hpp"

// Canvases and the drawing front end
#include "brush/canvas.hpp"
#include "brush/context.hpp"
#include "brush/sketch.hpp"
