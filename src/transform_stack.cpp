#include "brush/transform_stack.hpp"

namespace brush {

void TransformStack::push() {
    saved_.push_back(current_);
}

void TransformStack::pop() {
    if (saved_.empty()) return;
    current_ = saved_.back();
    saved_.pop_back();
}

void TransformStack::reset() {
    current_ = Affine3::identity();
}

void TransformStack::clear() {
    current_ = Affine3::identity();
    saved_.clear();
}

void TransformStack::translate(f32 x, f32 y) {
    apply(Affine3::fromTranslation({x, y, 0}));
}

void TransformStack::translate3d(f32 x, f32 y, f32 z) {
    apply(Affine3::fromTranslation({x, y, z}));
}

void TransformStack::rotate(f32 angle) {
    apply(Affine3::fromRotationZ(angle));
}

void TransformStack::rotateX(f32 angle) {
    apply(Affine3::fromRotationX(angle));
}

void TransformStack::rotateY(f32 angle) {
    apply(Affine3::fromRotationY(angle));
}

void TransformStack::rotateZ(f32 angle) {
    apply(Affine3::fromRotationZ(angle));
}

void TransformStack::rotateAxis(f32 angle, Vec3 axis) {
    apply(Affine3::fromAxisAngle(axis, angle));
}

void TransformStack::scale(f32 x, f32 y) {
    apply(Affine3::fromScale({x, y, 1}));
}

void TransformStack::scale3d(f32 x, f32 y, f32 z) {
    apply(Affine3::fromScale({x, y, z}));
}

void TransformStack::scaleUniform(f32 s) {
    apply(Affine3::fromScale({s, s, s}));
}

void TransformStack::shearX(f32 angle) {
    apply(Affine3::fromShearX(angle));
}

void TransformStack::shearY(f32 angle) {
    apply(Affine3::fromShearY(angle));
}

void TransformStack::apply(const Affine3& m) {
    current_ = current_ * m;
}

Point TransformStack::transformPoint2d(Point p) const {
    Vec3 out = current_.transformPoint({p.x, p.y, 0});
    return {out.x, out.y};
}

} // namespace brush
