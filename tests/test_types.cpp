#include <gtest/gtest.h>
#include <brush/error.hpp>
#include <brush/math.hpp>
#include <brush/types.hpp>
#include <brush/version.hpp>

#include <cmath>
#include <string>

using namespace brush;

static constexpr f32 kHalfPi = 1.57079632679f;

// Helper: component-wise near comparison.
static void expectNear(Vec3 a, Vec3 b, f32 eps = 1e-5f) {
    EXPECT_NEAR(a.x, b.x, eps);
    EXPECT_NEAR(a.y, b.y, eps);
    EXPECT_NEAR(a.z, b.z, eps);
}

// --- Size type aliases ---

TEST(TypeAliases, SizeTypes) {
    static_assert(sizeof(i32) == 4, "i32 must be 4 bytes");
    static_assert(sizeof(u32) == 4, "u32 must be 4 bytes");
    static_assert(sizeof(u64) == 8, "u64 must be 8 bytes");
    static_assert(sizeof(u16) == 2, "u16 must be 2 bytes");
    static_assert(sizeof(u8)  == 1, "u8 must be 1 byte");
    static_assert(sizeof(f32) == 4, "f32 must be 4 bytes");
    static_assert(sizeof(f64) == 8, "f64 must be 8 bytes");
}

TEST(Version, MatchesMacros) {
    EXPECT_EQ(std::string(version()),
              std::to_string(versionMajor()) + "." + std::to_string(versionMinor()) + "." +
                  std::to_string(versionPatch()));
}

// --- Color ---

TEST(Color, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c, Color::black());
    EXPECT_FALSE(c.isTransparent());
}

TEST(Color, Rgba8) {
    Color c = Color::rgba8(255, 0, 51, 102);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
    EXPECT_FLOAT_EQ(c.g, 0.0f);
    EXPECT_FLOAT_EQ(c.b, 0.2f);
    EXPECT_FLOAT_EQ(c.a, 0.4f);
    EXPECT_TRUE(c.isTransparent());
}

TEST(Color, Transparency) {
    EXPECT_TRUE(Color::transparent().isTransparent());
    EXPECT_TRUE((Color{1, 1, 1, 0.999f}).isTransparent());
    EXPECT_FALSE(Color::white().isTransparent());
    EXPECT_NE(Color::white(), Color::black());
}

// --- Handles ---

TEST(Handle, ZeroIsInvalid) {
    CanvasId none;
    EXPECT_FALSE(none.valid());
    EXPECT_TRUE((CanvasId{1}).valid());
}

TEST(Handle, Ordering) {
    ImageId a{1}, b{2};
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_NE(a, b);
    EXPECT_EQ(a, (ImageId{1}));
}

// --- Error / Result ---

TEST(Error, Describe) {
    EXPECT_EQ((Error{ErrorCode::CanvasNotFound, "canvas 3"}).describe(), "CanvasNotFound: canvas 3");
    EXPECT_EQ((Error{ErrorCode::DeviceError, ""}).describe(), "DeviceError");
    EXPECT_STREQ(errorCodeName(ErrorCode::UnknownMaterialProperty), "UnknownMaterialProperty");
}

TEST(Result, ValueAndError) {
    Result<int> good = 7;
    ASSERT_TRUE(good.ok());
    EXPECT_TRUE(static_cast<bool>(good));
    EXPECT_EQ(good.value(), 7);
    EXPECT_EQ(good.valueOr(1), 7);

    Result<int> bad = Error{ErrorCode::InvalidArgument, "nope"};
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(bad.valueOr(1), 1);
}

TEST(Result, Void) {
    Result<void> good;
    EXPECT_TRUE(good.ok());
    Result<void> bad = Error{ErrorCode::ImageNotFound, "image 2"};
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().message, "image 2");
}

// --- Vectors and quaternions ---

TEST(Vec3, Arithmetic) {
    Vec3 a{1, 2, 3}, b{4, 5, 6};
    EXPECT_EQ(a + b, (Vec3{5, 7, 9}));
    EXPECT_EQ(b - a, (Vec3{3, 3, 3}));
    EXPECT_FLOAT_EQ(a.dot(b), 32.0f);
    EXPECT_EQ((Vec3{1, 0, 0}).cross({0, 1, 0}), (Vec3{0, 0, 1}));
    EXPECT_FLOAT_EQ((Vec3{3, 4, 0}).length(), 5.0f);
    EXPECT_EQ((Vec3{}).normalized(), (Vec3{}));
    expectNear((Vec3{0, 0, 9}).normalized(), {0, 0, 1});
}

TEST(Quat, RotatesAboutAxis) {
    Quat q = Quat::fromAxisAngle({0, 0, 2}, kHalfPi);
    expectNear(q.rotate({1, 0, 0}), {0, 1, 0});
    expectNear(Quat::identity().rotate({1, 2, 3}), {1, 2, 3});
}

// --- Affine3 ---

TEST(Affine3, IdentityByDefault) {
    Affine3 m;
    EXPECT_TRUE(m.isIdentity());
    EXPECT_EQ(m.transformPoint({1, 2, 3}), (Vec3{1, 2, 3}));
    EXPECT_FLOAT_EQ(m.determinant(), 1.0f);
}

TEST(Affine3, TranslationScaleComposition) {
    Affine3 t = Affine3::fromTranslation({10, 20, 0});
    Affine3 s = Affine3::fromScale({2, 3, 1});
    // t * s scales first, then translates.
    EXPECT_EQ((t * s).transformPoint({1, 1, 0}), (Vec3{12, 23, 0}));
    EXPECT_EQ((s * t).transformPoint({1, 1, 0}), (Vec3{22, 63, 0}));
    EXPECT_EQ(t.transformVector({1, 1, 0}), (Vec3{1, 1, 0}));
    EXPECT_FALSE(t.isIdentity());
}

TEST(Affine3, Rotations) {
    expectNear(Affine3::fromRotationZ(kHalfPi).transformPoint({1, 0, 0}), {0, 1, 0});
    expectNear(Affine3::fromRotationX(kHalfPi).transformPoint({0, 1, 0}), {0, 0, 1});
    expectNear(Affine3::fromRotationY(kHalfPi).transformPoint({0, 0, 1}), {1, 0, 0});
    expectNear(Affine3::fromAxisAngle({0, 0, 1}, kHalfPi).transformPoint({1, 0, 0}), {0, 1, 0});
}

TEST(Affine3, Shear) {
    f32 angle = std::atan(0.5f);
    expectNear(Affine3::fromShearX(angle).transformPoint({0, 2, 0}), {1, 2, 0});
    expectNear(Affine3::fromShearY(angle).transformPoint({2, 0, 0}), {2, 1, 0});
}

TEST(DrawTransform, DecomposesAndRecomposes) {
    Affine3 m = Affine3::fromTranslation({5, 6, 0}) * Affine3::fromRotationZ(0.3f) *
                Affine3::fromScale({2, 4, 1});
    DrawTransform d = DrawTransform::fromAffine(m);
    expectNear(d.translation, {5, 6, 0});
    expectNear(d.scale, {2, 4, 1});
    Affine3 back = d.toAffine();
    expectNear(back.transformPoint({1, 1, 0}), m.transformPoint({1, 1, 0}), 1e-4f);
}

TEST(DrawTransform, MirrorFlipsXScale) {
    DrawTransform d = DrawTransform::fromAffine(Affine3::fromScale({-1, 1, 1}));
    EXPECT_FLOAT_EQ(d.scale.x, -1.0f);
    expectNear(d.toAffine().transformPoint({1, 2, 0}), {-1, 2, 0});
}
