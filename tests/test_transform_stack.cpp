#include <gtest/gtest.h>
#include <brush/transform_stack.hpp>

#include <cmath>

using namespace brush;

static constexpr f32 kPi = 3.14159265358979f;

static void expectPoint(Point p, f32 x, f32 y) {
    EXPECT_NEAR(p.x, x, 1e-4f);
    EXPECT_NEAR(p.y, y, 1e-4f);
}

// --- Basics ---

TEST(TransformStack, StartsAtIdentity) {
    TransformStack ts;
    EXPECT_TRUE(ts.current().isIdentity());
    EXPECT_EQ(ts.depth(), 0u);
    expectPoint(ts.transformPoint2d({3, 4}), 3, 4);
}

TEST(TransformStack, TranslateMovesOrigin) {
    TransformStack ts;
    ts.translate(12, -7);
    expectPoint(ts.transformPoint2d({0, 0}), 12, -7);
}

TEST(TransformStack, PushTranslatePopRestores) {
    TransformStack ts;
    for (f32 a : {0.0f, 5.0f, -100.0f}) {
        for (f32 b : {0.0f, 2.5f, 1e4f}) {
            ts.push();
            ts.translate(a, b);
            ts.pop();
            expectPoint(ts.transformPoint2d({0, 0}), 0, 0);
        }
    }
    EXPECT_EQ(ts.depth(), 0u);
}

TEST(TransformStack, PopOnEmptyIsNoOp) {
    TransformStack ts;
    ts.translate(3, 4);
    ts.rotate(0.5f);
    Affine3 before = ts.current();
    ts.pop();
    EXPECT_EQ(ts.current(), before);
    EXPECT_EQ(ts.depth(), 0u);
}

TEST(TransformStack, NestedPushPop) {
    TransformStack ts;
    ts.translate(10, 0);
    ts.push();
    ts.translate(0, 10);
    ts.push();
    ts.translate(5, 5);
    expectPoint(ts.transformPoint2d({0, 0}), 15, 15);
    ts.pop();
    expectPoint(ts.transformPoint2d({0, 0}), 10, 10);
    ts.pop();
    expectPoint(ts.transformPoint2d({0, 0}), 10, 0);
}

TEST(TransformStack, ResetKeepsSavedEntries) {
    TransformStack ts;
    ts.translate(1, 2);
    ts.push();
    ts.translate(5, 5);
    ts.reset();
    EXPECT_TRUE(ts.current().isIdentity());
    EXPECT_EQ(ts.depth(), 1u);
    ts.pop();
    expectPoint(ts.transformPoint2d({0, 0}), 1, 2);
}

TEST(TransformStack, ClearDropsEverything) {
    TransformStack ts;
    ts.push();
    ts.push();
    ts.scale(2, 2);
    ts.clear();
    EXPECT_TRUE(ts.current().isIdentity());
    EXPECT_EQ(ts.depth(), 0u);
}

// --- Composition happens in the local frame ---

TEST(TransformStack, TranslateThenRotateRotatesAboutNewOrigin) {
    TransformStack ts;
    ts.translate(100, 0);
    ts.rotate(kPi / 2);
    expectPoint(ts.transformPoint2d({10, 0}), 100, 10);
}

TEST(TransformStack, RotateThenTranslateMovesAlongRotatedAxis) {
    TransformStack ts;
    ts.rotate(kPi / 2);
    ts.translate(10, 0);
    expectPoint(ts.transformPoint2d({0, 0}), 0, 10);
}

TEST(TransformStack, ScaleAffectsLaterTranslation) {
    TransformStack ts;
    ts.scale(2, 3);
    ts.translate(5, 5);
    expectPoint(ts.transformPoint2d({1, 1}), 12, 18);
}

TEST(TransformStack, ShearX) {
    TransformStack ts;
    ts.shearX(kPi / 4);
    expectPoint(ts.transformPoint2d({0, 10}), 10, 10);
    expectPoint(ts.transformPoint2d({10, 0}), 10, 0);
}

TEST(TransformStack, ShearY) {
    TransformStack ts;
    ts.shearY(kPi / 4);
    expectPoint(ts.transformPoint2d({10, 0}), 10, 10);
    expectPoint(ts.transformPoint2d({0, 10}), 0, 10);
}

// --- 3D operations ---

TEST(TransformStack, Translate3dAndRotateY) {
    TransformStack ts;
    ts.translate3d(0, 0, 5);
    ts.rotateY(kPi / 2);
    Vec3 p = ts.transformPoint({1, 0, 0});
    EXPECT_NEAR(p.x, 0, 1e-4f);
    EXPECT_NEAR(p.y, 0, 1e-4f);
    EXPECT_NEAR(p.z, 4, 1e-4f);
}

TEST(TransformStack, RotateAxisMatchesRotateZ) {
    TransformStack a, b;
    a.rotateAxis(0.7f, {0, 0, 2});
    b.rotateZ(0.7f);
    Vec3 pa = a.transformPoint({3, 1, 0});
    Vec3 pb = b.transformPoint({3, 1, 0});
    EXPECT_NEAR(pa.x, pb.x, 1e-5f);
    EXPECT_NEAR(pa.y, pb.y, 1e-5f);
}

TEST(TransformStack, ScaleUniformAndApply) {
    TransformStack ts;
    ts.scaleUniform(2);
    ts.apply(Affine3::fromTranslation({1, 1, 1}));
    Vec3 p = ts.transformPoint({0, 0, 0});
    EXPECT_NEAR(p.x, 2, 1e-5f);
    EXPECT_NEAR(p.y, 2, 1e-5f);
    EXPECT_NEAR(p.z, 2, 1e-5f);
}

// --- Decomposition ---

TEST(TransformStack, ToDrawTransform) {
    TransformStack ts;
    ts.translate(40, 30);
    ts.rotate(kPi / 6);
    ts.scale(2, 3);
    DrawTransform dt = ts.toDrawTransform();
    EXPECT_NEAR(dt.translation.x, 40, 1e-4f);
    EXPECT_NEAR(dt.translation.y, 30, 1e-4f);
    EXPECT_NEAR(dt.scale.x, 2, 1e-4f);
    EXPECT_NEAR(dt.scale.y, 3, 1e-4f);
    EXPECT_NEAR(dt.scale.z, 1, 1e-4f);

    Affine3 back = dt.toAffine();
    Vec3 p = back.transformPoint({1, 1, 0});
    Vec3 q = ts.transformPoint({1, 1, 0});
    EXPECT_NEAR(p.x, q.x, 1e-3f);
    EXPECT_NEAR(p.y, q.y, 1e-3f);
}

TEST(TransformStack, MirroredDecompositionKeepsDeterminantSign) {
    TransformStack ts;
    ts.scale(-1, 1);
    DrawTransform dt = ts.toDrawTransform();
    EXPECT_LT(dt.toAffine().determinant(), 0);
    Vec3 p = dt.toAffine().transformPoint({5, 2, 0});
    EXPECT_NEAR(p.x, -5, 1e-4f);
    EXPECT_NEAR(p.y, 2, 1e-4f);
}
