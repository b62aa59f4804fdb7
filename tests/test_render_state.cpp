#include <gtest/gtest.h>
#include <brush/render_state.hpp>

using namespace brush;

// --- Defaults ---

TEST(RenderState, Defaults) {
    RenderState s;
    ASSERT_TRUE(s.fill().has_value());
    EXPECT_EQ(*s.fill(), Color::white());
    ASSERT_TRUE(s.stroke().has_value());
    EXPECT_EQ(*s.stroke(), Color::black());
    EXPECT_FLOAT_EQ(s.strokeWeight(), 1.0f);
    EXPECT_EQ(s.material(), MaterialKey::MakeColor(Color::white()));
    EXPECT_TRUE(s.transform().current().isIdentity());
}

TEST(RenderState, ResetRestoresDefaults) {
    RenderState s;
    s.clearFill();
    s.setStroke({1, 0, 0, 1});
    s.setStrokeWeight(4);
    s.useMaterial(MaterialId{3});
    s.transform().push();
    s.transform().translate(5, 5);

    s.reset();
    EXPECT_EQ(*s.fill(), Color::white());
    EXPECT_EQ(*s.stroke(), Color::black());
    EXPECT_FLOAT_EQ(s.strokeWeight(), 1.0f);
    EXPECT_EQ(s.material().kind, MaterialKey::Kind::Color);
    EXPECT_TRUE(s.transform().current().isIdentity());
    EXPECT_EQ(s.transform().depth(), 0u);
}

// --- Pass keys ---

TEST(RenderState, PassKeysFollowPaint) {
    RenderState s;
    s.setFill({0, 1, 0, 0.5f});
    auto fill = s.fillKey();
    ASSERT_TRUE(fill.has_value());
    EXPECT_EQ(fill->kind, MaterialKey::Kind::Color);
    EXPECT_TRUE(fill->transparent);
    EXPECT_EQ(fill->paint, (Color{0, 1, 0, 0.5f}));

    auto stroke = s.strokeKey();
    ASSERT_TRUE(stroke.has_value());
    EXPECT_FALSE(stroke->transparent);
    EXPECT_EQ(stroke->paint, Color::black());
}

TEST(RenderState, DisabledPassHasNoKey) {
    RenderState s;
    s.clearFill();
    s.clearStroke();
    EXPECT_FALSE(s.fillKey().has_value());
    EXPECT_FALSE(s.strokeKey().has_value());
}

TEST(RenderState, ColorKeyKeepsBackgroundImage) {
    RenderState s;
    s.setMaterial(MaterialKey::MakeColor(Color::white(), ImageId{4}));
    s.setFill({1, 0, 0, 1});
    EXPECT_EQ(s.fillKey()->backgroundImage, ImageId{4});
    EXPECT_EQ(s.fillKey()->paint, (Color{1, 0, 0, 1}));
}

TEST(RenderState, CustomMaterialIgnoresPaint) {
    RenderState s;
    s.useMaterial(MaterialId{8});
    s.setFill({1, 0, 0, 1});
    EXPECT_EQ(*s.fillKey(), MaterialKey::MakeCustom(MaterialId{8}));
    EXPECT_EQ(*s.strokeKey(), MaterialKey::MakeCustom(MaterialId{8}));
    s.clearStroke();
    EXPECT_FALSE(s.strokeKey().has_value());
}

// --- Immediate material properties ---

TEST(RenderState, MaterialPropertySwitchesToPbr) {
    RenderState s;
    ASSERT_TRUE(s.setMaterialProperty("roughness", MaterialValue::Float(1)).ok());
    EXPECT_EQ(s.material().kind, MaterialKey::Kind::Pbr);
    EXPECT_EQ(s.material().roughness, 255);
    EXPECT_EQ(s.material().metallic, 0);

    ASSERT_TRUE(s.setMaterialProperty("metallic", MaterialValue::Float(0.5f)).ok());
    EXPECT_EQ(s.material().roughness, 255);
    EXPECT_EQ(s.material().metallic, 128);
}

TEST(RenderState, MaterialPropertyAlbedoAndEmissive) {
    RenderState s;
    ASSERT_TRUE(s.setMaterialProperty("albedo", MaterialValue::Float4(1, 0, 0, 1)).ok());
    EXPECT_EQ(s.material().albedo, (std::array<u8, 4>{{255, 0, 0, 255}}));
    ASSERT_TRUE(s.setMaterialProperty("emissive", MaterialValue::Float4(0, 0, 1, 1)).ok());
    EXPECT_EQ(s.material().emissive, (std::array<u8, 4>{{0, 0, 255, 255}}));
}

TEST(RenderState, MaterialPropertyReplacesCustom) {
    RenderState s;
    s.useMaterial(MaterialId{2});
    ASSERT_TRUE(s.setMaterialProperty("metallic", MaterialValue::Float(1)).ok());
    EXPECT_EQ(s.material().kind, MaterialKey::Kind::Pbr);
}

TEST(RenderState, RejectedPropertyLeavesStateUnchanged) {
    RenderState s;
    auto wrong = s.setMaterialProperty("roughness", MaterialValue::Float4(1, 1, 1, 1));
    ASSERT_FALSE(wrong.ok());
    EXPECT_EQ(wrong.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(s.material().kind, MaterialKey::Kind::Color);

    auto unknown = s.setMaterialProperty("gloss", MaterialValue::Float(1));
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::UnknownMaterialProperty);
    EXPECT_EQ(s.material().kind, MaterialKey::Kind::Color);
}
