#include <gtest/gtest.h>
#include <brush/command.hpp>
#include <brush/command_visitor.hpp>

#include <string>
#include <vector>

using namespace brush;

// --- Mock visitor that logs the name of every visited command ---

class MockVisitor : public CommandVisitor {
public:
    std::vector<std::string> calls;
    Color lastColor;
    CornerRadii lastRadii{};
    f32 lastScalar = 0;
    std::string lastName;

    void visitSetFill(Color c) override { lastColor = c; calls.push_back("SetFill"); }
    void visitClearFill() override { calls.push_back("ClearFill"); }
    void visitSetStroke(Color c) override { lastColor = c; calls.push_back("SetStroke"); }
    void visitClearStroke() override { calls.push_back("ClearStroke"); }
    void visitSetStrokeWeight(f32 w) override { lastScalar = w; calls.push_back("SetStrokeWeight"); }
    void visitSetMaterialProperty(const std::string& name, const MaterialValue&) override {
        lastName = name;
        calls.push_back("SetMaterialProperty");
    }
    void visitUseMaterial(MaterialId) override { calls.push_back("UseMaterial"); }
    void visitRect(f32, f32, f32, f32, const CornerRadii& radii) override {
        lastRadii = radii;
        calls.push_back("Rect");
    }
    void visitDrawMesh(GeometryId) override { calls.push_back("DrawMesh"); }
    void visitDrawBox(f32, f32, f32) override { calls.push_back("DrawBox"); }
    void visitDrawSphere(f32, u32, u32) override { calls.push_back("DrawSphere"); }
    void visitBackgroundColor(Color c) override { lastColor = c; calls.push_back("BackgroundColor"); }
    void visitBackgroundImage(ImageId) override { calls.push_back("BackgroundImage"); }
    void visitPushTransform() override { calls.push_back("PushTransform"); }
    void visitPopTransform() override { calls.push_back("PopTransform"); }
    void visitResetTransform() override { calls.push_back("ResetTransform"); }
    void visitTranslate(f32, f32) override { calls.push_back("Translate"); }
    void visitRotate(f32 a) override { lastScalar = a; calls.push_back("Rotate"); }
    void visitScale(f32, f32) override { calls.push_back("Scale"); }
    void visitShearX(f32) override { calls.push_back("ShearX"); }
    void visitShearY(f32) override { calls.push_back("ShearY"); }
};

// --- Factories ---

TEST(DrawCommand, RectPayload) {
    DrawCommand cmd = DrawCommand::Rect(1, 2, 3, 4, {{5, 6, 7, 8}});
    EXPECT_EQ(cmd.type, DrawCommand::Type::Rect);
    EXPECT_FLOAT_EQ(cmd.data.rect.x, 1);
    EXPECT_FLOAT_EQ(cmd.data.rect.y, 2);
    EXPECT_FLOAT_EQ(cmd.data.rect.w, 3);
    EXPECT_FLOAT_EQ(cmd.data.rect.h, 4);
    EXPECT_FLOAT_EQ(cmd.data.rect.radii[0], 5);
    EXPECT_FLOAT_EQ(cmd.data.rect.radii[3], 8);
    EXPECT_TRUE(cmd.isDrawing());
}

TEST(DrawCommand, PaintPayloads) {
    DrawCommand fill = DrawCommand::SetFill({1, 0, 0, 1});
    EXPECT_EQ(fill.type, DrawCommand::Type::SetFill);
    EXPECT_EQ(fill.data.color, (Color{1, 0, 0, 1}));
    EXPECT_FALSE(fill.isDrawing());

    DrawCommand weight = DrawCommand::SetStrokeWeight(3.5f);
    EXPECT_FLOAT_EQ(weight.data.scalar, 3.5f);

    DrawCommand prop = DrawCommand::SetMaterialProperty("metallic", MaterialValue::Float(0.4f));
    EXPECT_EQ(prop.name, "metallic");
    EXPECT_EQ(prop.value, MaterialValue::Float(0.4f));
}

TEST(DrawCommand, HandlePayloads) {
    EXPECT_EQ(DrawCommand::DrawMesh(GeometryId{7}).data.geometry, GeometryId{7});
    EXPECT_EQ(DrawCommand::BackgroundImage(ImageId{3}).data.image, ImageId{3});
    EXPECT_EQ(DrawCommand::UseMaterial(MaterialId{9}).data.material, MaterialId{9});
}

TEST(DrawCommand, SpherePayload) {
    DrawCommand cmd = DrawCommand::DrawSphere(2.5f, 12, 6);
    EXPECT_FLOAT_EQ(cmd.data.sphere.radius, 2.5f);
    EXPECT_EQ(cmd.data.sphere.sectors, 12u);
    EXPECT_EQ(cmd.data.sphere.stacks, 6u);
}

TEST(DrawCommand, TypeNames) {
    EXPECT_STREQ(commandTypeName(DrawCommand::Type::Rect), "Rect");
    EXPECT_STREQ(commandTypeName(DrawCommand::Type::BackgroundImage), "BackgroundImage");
    EXPECT_STREQ(commandTypeName(DrawCommand::Type::UseMaterial), "UseMaterial");
}

TEST(DrawCommand, CopyKeepsPayload) {
    DrawCommand a = DrawCommand::Translate(4, -2);
    DrawCommand b = a;
    EXPECT_EQ(b.type, DrawCommand::Type::Translate);
    EXPECT_FLOAT_EQ(b.data.vec.x, 4);
    EXPECT_FLOAT_EQ(b.data.vec.y, -2);
}

// --- CommandBuffer ---

TEST(CommandBuffer, StartsEmpty) {
    CommandBuffer buf;
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.size(), 0u);
}

TEST(CommandBuffer, ReplaysInRecordingOrder) {
    CommandBuffer buf;
    buf.push(DrawCommand::PushTransform());
    buf.push(DrawCommand::SetFill(Color::white()));
    buf.push(DrawCommand::Rect(0, 0, 1, 1));
    buf.push(DrawCommand::Translate(1, 1));
    buf.push(DrawCommand::Rotate(0.5f));
    buf.push(DrawCommand::Scale(2, 2));
    buf.push(DrawCommand::ShearX(0.1f));
    buf.push(DrawCommand::ShearY(0.1f));
    buf.push(DrawCommand::ResetTransform());
    buf.push(DrawCommand::PopTransform());
    buf.push(DrawCommand::ClearFill());
    buf.push(DrawCommand::SetStroke(Color::black()));
    buf.push(DrawCommand::SetStrokeWeight(2));
    buf.push(DrawCommand::ClearStroke());
    buf.push(DrawCommand::DrawBox(1, 1, 1));
    buf.push(DrawCommand::DrawSphere(1, 8, 4));
    buf.push(DrawCommand::DrawMesh(GeometryId{1}));
    buf.push(DrawCommand::BackgroundColor(Color::black()));
    buf.push(DrawCommand::BackgroundImage(ImageId{1}));
    buf.push(DrawCommand::UseMaterial(MaterialId{1}));
    buf.push(DrawCommand::SetMaterialProperty("roughness", MaterialValue::Float(1)));

    MockVisitor v;
    buf.accept(v);
    std::vector<std::string> expected = {
        "PushTransform", "SetFill", "Rect", "Translate", "Rotate", "Scale", "ShearX",
        "ShearY", "ResetTransform", "PopTransform", "ClearFill", "SetStroke",
        "SetStrokeWeight", "ClearStroke", "DrawBox", "DrawSphere", "DrawMesh",
        "BackgroundColor", "BackgroundImage", "UseMaterial", "SetMaterialProperty"};
    EXPECT_EQ(v.calls, expected);
    EXPECT_EQ(v.lastName, "roughness");
}

TEST(CommandBuffer, DispatchForwardsArguments) {
    MockVisitor v;
    dispatchCommand(DrawCommand::Rect(0, 0, 10, 10, {{1, 2, 3, 4}}), v);
    EXPECT_FLOAT_EQ(v.lastRadii[1], 2);
    EXPECT_FLOAT_EQ(v.lastRadii[2], 3);

    dispatchCommand(DrawCommand::BackgroundColor({0.1f, 0.2f, 0.3f, 1}), v);
    EXPECT_FLOAT_EQ(v.lastColor.g, 0.2f);

    dispatchCommand(DrawCommand::Rotate(1.25f), v);
    EXPECT_FLOAT_EQ(v.lastScalar, 1.25f);
}

TEST(CommandBuffer, TakeEmptiesBuffer) {
    CommandBuffer buf;
    buf.push(DrawCommand::SetFill(Color::white()));
    buf.push(DrawCommand::Rect(0, 0, 1, 1));
    auto taken = buf.take();
    EXPECT_EQ(taken.size(), 2u);
    EXPECT_EQ(taken[1].type, DrawCommand::Type::Rect);
    EXPECT_TRUE(buf.empty());

    MockVisitor v;
    buf.accept(v);
    EXPECT_TRUE(v.calls.empty());
}

TEST(CommandBuffer, Clear) {
    CommandBuffer buf;
    buf.push(DrawCommand::PushTransform());
    buf.clear();
    EXPECT_EQ(buf.size(), 0u);
}
