#include <gtest/gtest.h>
#include <brush/brush.hpp>

#include <memory>

using namespace brush;

// Helper: a sketch on a fresh 16x16 canvas.
struct SketchFixture {
    std::shared_ptr<CpuDevice> device = std::make_shared<CpuDevice>();
    Context ctx{device};
    CanvasId canvas = ctx.createCanvas(16, 16).value();
    Sketch sketch{ctx, canvas};

    const CommandBuffer& log() const { return ctx.canvas(canvas)->commands(); }
};

// Helper: count commands of a given type in a log.
static int countCommands(const CommandBuffer& buf, DrawCommand::Type type) {
    int n = 0;
    for (const auto& cmd : buf.commands()) {
        if (cmd.type == type) ++n;
    }
    return n;
}

// --- Canvas transients ---

TEST(Canvas, RetireDespawnsAndDestroysTransientMeshes) {
    CpuDevice device;
    auto target = TextureTarget::Create(device, 4, 4, PixelFormat::RGBA8Unorm);
    ASSERT_TRUE(target.ok());
    Canvas canvas(CanvasId{1}, std::move(target.value()), 3);
    EXPECT_EQ(canvas.layer(), 3u);
    EXPECT_EQ(canvas.width(), 4u);

    MeshData quad;
    tessellateRect(quad, 0, 0, 1, 1, {}, Color::white(), ShapeMode::Fill());
    MeshId transient = device.createMesh(quad).value();
    MeshId retained = device.createMesh(quad).value();
    MaterialId mat = device.createMaterial({}).value();

    DrawableDesc a;
    a.mesh = transient;
    a.material = mat;
    DrawableDesc b = a;
    b.mesh = retained;
    canvas.addTransient(device.spawnDrawable(a).value(), transient);
    canvas.addTransient(device.spawnDrawable(b).value(), MeshId{});
    EXPECT_EQ(canvas.transientEntities().size(), 2u);
    EXPECT_EQ(canvas.transientMeshes().size(), 1u);

    canvas.retireTransients(device);
    EXPECT_EQ(device.drawableCount(), 0u);
    EXPECT_FALSE(device.hasMesh(transient));
    EXPECT_TRUE(device.hasMesh(retained));
    EXPECT_TRUE(canvas.transientEntities().empty());

    canvas.target().destroy(device);
}

// --- Sketch records one command per call ---

TEST(Sketch, PaintCallsRecordState) {
    SketchFixture f;
    ASSERT_TRUE(f.sketch.fill(1, 0, 0).ok());
    ASSERT_TRUE(f.sketch.noFill().ok());
    ASSERT_TRUE(f.sketch.stroke(Color::white()).ok());
    ASSERT_TRUE(f.sketch.noStroke().ok());
    ASSERT_TRUE(f.sketch.strokeWeight(3).ok());
    ASSERT_TRUE(f.sketch.materialProperty("metallic", MaterialValue::Float(1)).ok());
    ASSERT_EQ(f.log().size(), 6u);
    EXPECT_EQ(f.log().commands()[0].data.color, (Color{1, 0, 0, 1}));
    EXPECT_EQ(f.log().commands()[5].type, DrawCommand::Type::SetMaterialProperty);
    EXPECT_EQ(f.device->drawableCount(), 0u);
}

TEST(Sketch, RectWithCornerRadii) {
    SketchFixture f;
    ASSERT_TRUE(f.sketch.rect(1, 2, 3, 4, 5, 6, 7, 8).ok());
    const DrawCommand& cmd = f.log().commands()[0];
    EXPECT_EQ(cmd.type, DrawCommand::Type::Rect);
    EXPECT_FLOAT_EQ(cmd.data.rect.radii[0], 5);
    EXPECT_FLOAT_EQ(cmd.data.rect.radii[2], 7);
}

TEST(Sketch, TransformCalls) {
    SketchFixture f;
    ASSERT_TRUE(f.sketch.pushMatrix().ok());
    ASSERT_TRUE(f.sketch.translate(1, 1).ok());
    ASSERT_TRUE(f.sketch.rotate(0.5f).ok());
    ASSERT_TRUE(f.sketch.scale(2).ok());
    ASSERT_TRUE(f.sketch.shearX(0.1f).ok());
    ASSERT_TRUE(f.sketch.shearY(0.1f).ok());
    ASSERT_TRUE(f.sketch.resetMatrix().ok());
    ASSERT_TRUE(f.sketch.popMatrix().ok());
    EXPECT_EQ(f.log().size(), 8u);
    EXPECT_FLOAT_EQ(f.log().commands()[3].data.vec.y, 2);
}

TEST(Sketch, ShapesAndBackgrounds) {
    SketchFixture f;
    ASSERT_TRUE(f.sketch.background(0, 0, 0).ok());
    ASSERT_TRUE(f.sketch.background(ImageId{4}).ok());
    ASSERT_TRUE(f.sketch.box(1, 2, 3).ok());
    ASSERT_TRUE(f.sketch.sphere(2).ok());
    ASSERT_TRUE(f.sketch.drawGeometry(GeometryId{9}).ok());
    EXPECT_EQ(countCommands(f.log(), DrawCommand::Type::BackgroundColor), 1);
    EXPECT_EQ(countCommands(f.log(), DrawCommand::Type::BackgroundImage), 1);
    EXPECT_EQ(f.log().commands()[3].data.sphere.sectors, 24u);
    EXPECT_EQ(f.log().commands()[3].data.sphere.stacks, 16u);
}

TEST(Sketch, DestroyedCanvasReportsNotFound) {
    SketchFixture f;
    ASSERT_TRUE(f.ctx.destroyCanvas(f.canvas).ok());
    EXPECT_EQ(f.sketch.rect(0, 0, 1, 1).error().code, ErrorCode::CanvasNotFound);
    EXPECT_EQ(f.sketch.endDraw().error().code, ErrorCode::CanvasNotFound);
}

TEST(Sketch, FrameEndToEnd) {
    SketchFixture f;
    ASSERT_TRUE(f.sketch.beginDraw().ok());
    ASSERT_TRUE(f.sketch.background(1, 1, 1).ok());
    ASSERT_TRUE(f.sketch.noStroke().ok());
    ASSERT_TRUE(f.sketch.fill(0, 0, 1).ok());
    ASSERT_TRUE(f.sketch.translate(8, 0).ok());
    ASSERT_TRUE(f.sketch.rect(0, 0, 8, 16).ok());
    ASSERT_TRUE(f.sketch.endDraw().ok());
    EXPECT_EQ(f.device->presentCount(), 1u);

    auto pixels = f.ctx.readback(f.canvas);
    ASSERT_TRUE(pixels.ok());
    EXPECT_EQ(pixels.value()[0], Color::white());
    EXPECT_EQ(pixels.value()[12], (Color{0, 0, 1, 1}));
    EXPECT_EQ(pixels.value()[15 * 16 + 15], (Color{0, 0, 1, 1}));
}
