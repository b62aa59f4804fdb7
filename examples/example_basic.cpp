/**
 * example_basic.cpp - Basic drawing with brush (CPU + GPU)
 *
 * Demonstrates:
 *   - Creating a context on the CPU device and, when available, on OpenGL
 *   - Backgrounds, fills, strokes and rounded rectangles
 *   - Transform push/pop and a retained box mesh
 *   - Reading the canvas back and writing it to a raw PPM file
 *
 * Build:
 *   cmake -B build -DBRUSH_BUILD_EXAMPLES=ON -DBRUSH_ENABLE_GL=ON && cmake --build build
 *   ./build/example_basic
 *
 * Output: basic_cpu.ppm, basic_gpu.ppm
 */

#include <brush/brush.hpp>
#include <algorithm>
#include <cstdio>
#include <fstream>

#if BRUSH_HAS_GL
#include <brush/gpu/gl/gl_device.hpp>
#include <EGL/egl.h>
#endif

// Write linear colors (row-major, top row first) to PPM
static void writePPM(const char* filename, const std::vector<brush::LinearColor>& pixels,
                     int w, int h) {
    std::ofstream f(filename, std::ios::binary);
    f << "P6\n" << w << " " << h << "\n255\n";
    auto toByte = [](float v) { return char(std::clamp(v, 0.0f, 1.0f) * 255.0f + 0.5f); };
    for (const auto& p : pixels) {
        f.put(toByte(p.r)); f.put(toByte(p.g)); f.put(toByte(p.b));
    }
    std::printf("Written: %s (%dx%d)\n", filename, w, h);
}

// Draw the same scene on any device
static brush::Result<void> drawScene(brush::Sketch& s, int W, int H) {
    using brush::f32;

    s.beginDraw();
    s.background(0.15f, 0.15f, 0.2f);

    // Filled rectangles with the default stroke
    s.fill(0.85f, 0.25f, 0.25f);
    s.rect(20, 20, 160, 100);
    s.fill(0.25f, 0.7f, 0.25f, 0.7f);
    s.rect(100, 60, 160, 100);

    // Rounded, stroked rectangle
    s.noFill();
    s.stroke(1, 1, 0);
    s.strokeWeight(4);
    s.rect(30, 180, 340, 80, 20, 20, 20, 20);

    // Rotated square about the canvas centre
    s.pushMatrix();
    s.translate(f32(W) * 0.75f, f32(H) * 0.3f);
    s.rotate(0.5f);
    s.noStroke();
    s.fill(0.25f, 0.25f, 0.85f);
    s.rect(-40, -40, 80, 80);
    s.popMatrix();

    // A box from the retained geometry store
    brush::GeometryId box = s.context().geometry().createBox(60, 60, 60);
    s.pushMatrix();
    s.translate(f32(W) - 60, f32(H) - 60);
    s.fill(0.9f, 0.6f, 0.2f);
    s.drawGeometry(box);
    s.popMatrix();

    return s.endDraw();
}

static int render(brush::Context& ctx, const char* filename, int W, int H) {
    auto canvas = ctx.createCanvas(W, H);
    if (!canvas) {
        std::printf("createCanvas failed: %s\n", canvas.error().describe().c_str());
        return 1;
    }
    brush::Sketch sketch(ctx, canvas.value());
    auto drawn = drawScene(sketch, W, H);
    if (!drawn) {
        std::printf("draw failed: %s\n", drawn.error().describe().c_str());
        return 1;
    }
    auto pixels = ctx.readback(canvas.value());
    if (!pixels) {
        std::printf("readback failed: %s\n", pixels.error().describe().c_str());
        return 1;
    }
    writePPM(filename, pixels.value(), W, H);
    return 0;
}

int main() {
    const int W = 400, H = 300;

    // ---- CPU rendering ----
    {
        brush::Context ctx(std::make_shared<brush::CpuDevice>());
        if (int rc = render(ctx, "basic_cpu.ppm", W, H)) return rc;
    }

    // ---- GPU rendering ----
#if BRUSH_HAS_GL
    {
        // Create headless EGL context
        EGLDisplay display = eglGetDisplay(EGL_DEFAULT_DISPLAY);
        if (display == EGL_NO_DISPLAY) {
            std::printf("GPU: EGL display not available, skipping\n");
            return 0;
        }
        eglInitialize(display, nullptr, nullptr);

        EGLint configAttribs[] = {
            EGL_SURFACE_TYPE, EGL_PBUFFER_BIT,
            EGL_RENDERABLE_TYPE, EGL_OPENGL_BIT,
            EGL_RED_SIZE, 8, EGL_GREEN_SIZE, 8,
            EGL_BLUE_SIZE, 8, EGL_ALPHA_SIZE, 8,
            EGL_NONE
        };
        EGLConfig config;
        EGLint numConfigs;
        eglChooseConfig(display, configAttribs, &config, 1, &numConfigs);

        EGLint pbufAttribs[] = {EGL_WIDTH, 1, EGL_HEIGHT, 1, EGL_NONE};
        EGLSurface eglSurf = eglCreatePbufferSurface(display, config, pbufAttribs);

        eglBindAPI(EGL_OPENGL_API);
        EGLint ctxAttribs[] = {
            EGL_CONTEXT_MAJOR_VERSION, 3, EGL_CONTEXT_MINOR_VERSION, 3,
            EGL_CONTEXT_OPENGL_PROFILE_MASK, EGL_CONTEXT_OPENGL_CORE_PROFILE_BIT,
            EGL_NONE
        };
        EGLContext eglCtx = eglCreateContext(display, config, EGL_NO_CONTEXT, ctxAttribs);
        eglMakeCurrent(display, eglSurf, eglSurf, eglCtx);

        int rc = 0;
        auto device = brush::RenderDevices::MakeGL();
        if (!device) {
            std::printf("GPU: failed to create GL device\n");
        } else {
            brush::Context ctx(device);
            rc = render(ctx, "basic_gpu.ppm", W, H);
            if (rc == 0) std::printf("GPU: Rendered with OpenGL\n");
        }

        // Cleanup EGL
        eglMakeCurrent(display, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
        eglDestroyContext(display, eglCtx);
        eglDestroySurface(display, eglSurf);
        eglTerminate(display);
        if (rc) return rc;
    }
#else
    std::printf("GPU: GL device not available (build with -DBRUSH_ENABLE_GL=ON)\n");
#endif

    return 0;
}
