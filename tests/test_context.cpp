#include <gtest/gtest.h>
#include <brush/context.hpp>
#include <brush/cpu_device.hpp>

#include <memory>
#include <vector>

using namespace brush;

// --- Fixture: a context on a CPU device we can inspect ---

class ContextTest : public ::testing::Test {
protected:
    std::shared_ptr<CpuDevice> device = std::make_shared<CpuDevice>(256);
    Context ctx{device};

    CanvasId makeCanvas(u32 w = 8, u32 h = 8) {
        auto id = ctx.createCanvas(w, h);
        EXPECT_TRUE(id.ok());
        return id.value();
    }
};

// --- Canvas lifecycle ---

TEST_F(ContextTest, CreateCanvas) {
    CanvasId c = makeCanvas(10, 6);
    const Canvas* canvas = ctx.canvas(c);
    ASSERT_NE(canvas, nullptr);
    EXPECT_EQ(canvas->width(), 10u);
    EXPECT_EQ(canvas->height(), 6u);
    EXPECT_EQ(canvas->format(), PixelFormat::RGBA16Float);
    EXPECT_EQ(canvas->layer(), 1u);
    EXPECT_TRUE(device->hasTexture(canvas->target().texture()));
    EXPECT_EQ(device->bufferSize(canvas->target().readbackBuffer()), 256u * 6);
    EXPECT_EQ(ctx.canvasCount(), 1u);
}

TEST_F(ContextTest, CanvasesGetDistinctLayers) {
    CanvasId a = makeCanvas();
    CanvasId b = makeCanvas();
    EXPECT_NE(a, b);
    EXPECT_NE(ctx.canvas(a)->layer(), ctx.canvas(b)->layer());
}

TEST_F(ContextTest, CreateCanvasWithFormat) {
    auto c = ctx.createCanvas(4, 4, PixelFormat::RGBA8Unorm);
    ASSERT_TRUE(c.ok());
    EXPECT_EQ(ctx.canvas(c.value())->format(), PixelFormat::RGBA8Unorm);
    EXPECT_EQ(ctx.createCanvas(4, 4, PixelFormat::R8Unorm).error().code,
              ErrorCode::UnsupportedPixelFormat);
    EXPECT_EQ(ctx.createCanvas(0, 4).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(ctx.canvasCount(), 1u);
}

TEST_F(ContextTest, DestroyCanvasReleasesEverything) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 4, 4)).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_GT(device->drawableCount(), 0u);

    ASSERT_TRUE(ctx.destroyCanvas(c).ok());
    EXPECT_EQ(device->drawableCount(), 0u);
    EXPECT_EQ(device->meshCount(), 0u);
    EXPECT_EQ(device->textureCount(), 0u);
    EXPECT_EQ(device->bufferCount(), 0u);
    EXPECT_EQ(ctx.canvas(c), nullptr);

    // The freed layer is handed out again.
    CanvasId next = makeCanvas();
    EXPECT_EQ(ctx.canvas(next)->layer(), 1u);
}

TEST_F(ContextTest, LayerExhaustion) {
    std::shared_ptr<CpuDevice> dev = std::make_shared<CpuDevice>();
    ContextConfig config;
    config.maxRenderLayers = 2;
    Context small(dev, config);
    ASSERT_TRUE(small.createCanvas(2, 2).ok());
    auto full = small.createCanvas(2, 2);
    ASSERT_FALSE(full.ok());
    EXPECT_EQ(full.error().code, ErrorCode::DeviceError);
    EXPECT_EQ(dev->textureCount(), 1u);
}

TEST_F(ContextTest, UnknownCanvas) {
    CanvasId bogus{42};
    auto rec = ctx.record(bogus, DrawCommand::PushTransform());
    ASSERT_FALSE(rec.ok());
    EXPECT_EQ(rec.error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(rec.error().message, "canvas 42");
    EXPECT_EQ(ctx.flush(bogus).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.beginDraw(bogus).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.endDraw(bogus).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.readback(bogus).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.updatePixels(bogus, {}).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.updateRegion(bogus, 0, 0, 0, 0, {}).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.resizeCanvas(bogus, 2, 2).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(ctx.destroyCanvas(bogus).error().code, ErrorCode::CanvasNotFound);
}

// --- Frame cycle ---

TEST_F(ContextTest, RecordDoesNoDeviceWork) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 4, 4)).ok());
    EXPECT_EQ(ctx.canvas(c)->commands().size(), 1u);
    EXPECT_EQ(device->drawableCount(), 0u);
    EXPECT_EQ(device->meshCount(), 0u);
}

TEST_F(ContextTest, FlushClearsLogAndRenders) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 4, 4)).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_TRUE(ctx.canvas(c)->commands().empty());
    EXPECT_EQ(device->renderCount(), 1u);
}

TEST_F(ContextTest, FlushOfEmptyLogRetiresWithoutRendering) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.beginDraw(c).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::SetFill(Color{0, 1, 0, 1})).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 4, 4)).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_EQ(device->drawableCount(), 2u);
    size_t meshes = device->meshCount();
    EXPECT_GT(meshes, 0u);

    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_EQ(device->renderCount(), 1u);
    EXPECT_EQ(device->drawableCount(), 0u);
    EXPECT_EQ(device->meshCount(), 0u);
    EXPECT_TRUE(ctx.canvas(c)->transientEntities().empty());

    // The rendered frame stays in the texture.
    auto pixels = ctx.readback(c);
    ASSERT_TRUE(pixels.ok());
    EXPECT_EQ(pixels.value()[1 * 8 + 1], (Color{0, 1, 0, 1}));
}

TEST_F(ContextTest, EndDrawPresents) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundColor(Color::black())).ok());
    ASSERT_TRUE(ctx.endDraw(c).ok());
    EXPECT_EQ(device->renderCount(), 1u);
    EXPECT_EQ(device->presentCount(), 1u);
}

TEST_F(ContextTest, BeginDrawResetsState) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::ClearFill()).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::Translate(3, 3)).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_FALSE(ctx.canvas(c)->state().fill().has_value());

    ASSERT_TRUE(ctx.beginDraw(c).ok());
    EXPECT_TRUE(ctx.canvas(c)->state().fill().has_value());
    EXPECT_TRUE(ctx.canvas(c)->state().transform().current().isIdentity());
}

TEST_F(ContextTest, StatePersistsAcrossFlushes) {
    CanvasId c = makeCanvas();
    ASSERT_TRUE(ctx.record(c, DrawCommand::SetFill({1, 0, 0, 1})).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::ClearStroke()).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 8, 8)).ok());
    auto pixels = ctx.readback(c);
    ASSERT_TRUE(pixels.ok());
    EXPECT_EQ(pixels.value()[0], (LinearColor{1, 0, 0, 1}));
}

// --- Pixel I/O ---

TEST_F(ContextTest, ReadbackOfFreshCanvasIsTransparent) {
    CanvasId c = makeCanvas(3, 2);
    auto pixels = ctx.readback(c);
    ASSERT_TRUE(pixels.ok());
    ASSERT_EQ(pixels.value().size(), 6u);
    for (const auto& p : pixels.value()) {
        EXPECT_EQ(p, Color::transparent());
    }
}

TEST_F(ContextTest, ReadbackFlushesPendingCommands) {
    CanvasId c = makeCanvas(4, 4);
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundColor({0, 0, 1, 1})).ok());
    auto pixels = ctx.readback(c);
    ASSERT_TRUE(pixels.ok());
    for (const auto& p : pixels.value()) {
        EXPECT_EQ(p, (LinearColor{0, 0, 1, 1}));
    }
    EXPECT_TRUE(ctx.canvas(c)->commands().empty());
}

TEST_F(ContextTest, ReadbackIsRowMajorTopRowFirst) {
    CanvasId c = makeCanvas(2, 2);
    ASSERT_TRUE(ctx.record(c, DrawCommand::ClearStroke()).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::SetFill({1, 0, 0, 1})).ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::Rect(0, 0, 2, 1)).ok());
    auto pixels = ctx.readback(c).value();
    EXPECT_EQ(pixels[0], (LinearColor{1, 0, 0, 1}));
    EXPECT_EQ(pixels[1], (LinearColor{1, 0, 0, 1}));
    EXPECT_EQ(pixels[2], Color::transparent());
    EXPECT_EQ(pixels[3], Color::transparent());
}

TEST_F(ContextTest, UpdatePixelsRoundTrip) {
    CanvasId c = makeCanvas(2, 2);
    std::vector<LinearColor> pixels = {
        {1, 0, 0, 1}, {0, 1, 0, 1}, {0, 0, 1, 1}, {0.5f, 0.5f, 0.5f, 0.5f}};
    ASSERT_TRUE(ctx.updatePixels(c, pixels).ok());
    EXPECT_EQ(ctx.readback(c).value(), pixels);
}

TEST_F(ContextTest, UpdatePixelsFlushesFirst) {
    CanvasId c = makeCanvas(2, 2);
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundColor({1, 0, 0, 1})).ok());
    std::vector<LinearColor> blue(4, {0, 0, 1, 1});
    ASSERT_TRUE(ctx.updatePixels(c, blue).ok());
    EXPECT_EQ(device->renderCount(), 1u);
    EXPECT_EQ(ctx.readback(c).value(), blue);
}

TEST_F(ContextTest, UpdatePixelsSizeMismatchTouchesNothing) {
    CanvasId c = makeCanvas(2, 2);
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundColor({1, 0, 0, 1})).ok());
    auto r = ctx.updatePixels(c, std::vector<LinearColor>(3));
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.error().message, "expected 4 pixels for 2x2 region, got 3");
    // Rejected before the pending log was flushed.
    EXPECT_EQ(device->renderCount(), 0u);
    EXPECT_EQ(ctx.canvas(c)->commands().size(), 1u);
}

TEST_F(ContextTest, UpdateRegion) {
    CanvasId c = makeCanvas(3, 3);
    ASSERT_TRUE(ctx.updateRegion(c, 1, 1, 2, 1, {{1, 0, 0, 1}, {0, 1, 0, 1}}).ok());
    auto pixels = ctx.readback(c).value();
    EXPECT_EQ(pixels[4], (LinearColor{1, 0, 0, 1}));
    EXPECT_EQ(pixels[5], (LinearColor{0, 1, 0, 1}));
    EXPECT_EQ(pixels[3], Color::transparent());

    auto outside = ctx.updateRegion(c, 2, 2, 2, 1, {{1, 0, 0, 1}, {0, 1, 0, 1}});
    EXPECT_EQ(outside.error().code, ErrorCode::InvalidArgument);
    auto count = ctx.updateRegion(c, 0, 0, 2, 2, {{1, 0, 0, 1}});
    EXPECT_EQ(count.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ContextTest, ResizeRecreatesReadbackBuffer) {
    CanvasId c = makeCanvas(4, 4);
    BufferId before = ctx.canvas(c)->target().readbackBuffer();
    ASSERT_TRUE(ctx.resizeCanvas(c, 100, 3).ok());

    const Canvas* canvas = ctx.canvas(c);
    EXPECT_EQ(canvas->width(), 100u);
    EXPECT_EQ(canvas->height(), 3u);
    EXPECT_NE(canvas->target().readbackBuffer(), before);
    // 100 * 8 bytes padded to 1024.
    EXPECT_EQ(device->bufferSize(canvas->target().readbackBuffer()), 1024u * 3);
    EXPECT_EQ(device->bufferCount(), 1u);
    EXPECT_EQ(ctx.readback(c).value().size(), 300u);
    EXPECT_EQ(ctx.resizeCanvas(c, 0, 3).error().code, ErrorCode::InvalidArgument);
}

// --- Images ---

TEST_F(ContextTest, DestroyImageDropsCachedMaterials) {
    CanvasId c = makeCanvas(2, 2);
    auto image = ctx.images().createFromColors(1, 1, PixelFormat::RGBA8Unorm, {{0, 1, 0, 1}});
    ASSERT_TRUE(image.ok());
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundImage(image.value())).ok());
    ASSERT_TRUE(ctx.flush(c).ok());
    EXPECT_EQ(ctx.materials().cachedCount(), 1u);

    // Retire the drawable that samples the image before destroying it.
    ASSERT_TRUE(ctx.record(c, DrawCommand::BackgroundColor(Color::black())).ok());
    ASSERT_TRUE(ctx.flush(c).ok());

    ASSERT_TRUE(ctx.destroyImage(image.value()).ok());
    EXPECT_EQ(ctx.materials().cachedCount(), 1u);
    EXPECT_FALSE(ctx.images().contains(image.value()));
    EXPECT_EQ(ctx.destroyImage(image.value()).error().code, ErrorCode::ImageNotFound);
}

TEST_F(ContextTest, DestructorReleasesDeviceResources) {
    auto dev = std::make_shared<CpuDevice>();
    {
        Context scoped(dev);
        auto c = scoped.createCanvas(4, 4);
        ASSERT_TRUE(c.ok());
        ASSERT_TRUE(scoped.record(c.value(), DrawCommand::Rect(0, 0, 2, 2)).ok());
        ASSERT_TRUE(scoped.flush(c.value()).ok());
        ASSERT_TRUE(scoped.materials().createPbr().ok());
        scoped.geometry().createBox(1, 1, 1);
    }
    EXPECT_EQ(dev->drawableCount(), 0u);
    EXPECT_EQ(dev->meshCount(), 0u);
    EXPECT_EQ(dev->materialCount(), 0u);
    EXPECT_EQ(dev->textureCount(), 0u);
    EXPECT_EQ(dev->bufferCount(), 0u);
}
