#pragma once

/**
 * @file transform_stack.hpp
 * @brief Save/restore stack of 3D affine transforms used to position drawn primitives.
 */

#include "brush/math.hpp"
#include "brush/types.hpp"
#include <cstddef>
#include <vector>

namespace brush {

/// @brief The current model transform plus a stack of saved transforms.
///
/// Every incremental operation right-multiplies a delta onto the current
/// transform (current = current * delta), so deltas apply in the local
/// frame set up by earlier operations.
class TransformStack {
public:
    /// @brief The composed current transform.
    const Affine3& current() const { return current_; }

    /// @brief Number of saved transforms.
    size_t depth() const { return saved_.size(); }

    /// @brief Save the current transform.
    void push();
    /// @brief Restore the most recently saved transform. No-op when nothing is saved.
    void pop();
    /// @brief Reset the current transform to identity. Saved transforms are kept.
    void reset();
    /// @brief Reset to identity and drop every saved transform.
    void clear();

    void translate(f32 x, f32 y);
    void translate3d(f32 x, f32 y, f32 z);
    /// @brief Rotate about Z by angle radians.
    void rotate(f32 angle);
    void rotateX(f32 angle);
    void rotateY(f32 angle);
    void rotateZ(f32 angle);
    void rotateAxis(f32 angle, Vec3 axis);
    void scale(f32 x, f32 y);
    void scale3d(f32 x, f32 y, f32 z);
    void scaleUniform(f32 s);
    void shearX(f32 angle);
    void shearY(f32 angle);
    /// @brief Compose an arbitrary transform onto the current one.
    void apply(const Affine3& m);

    /// @brief Replace the current transform.
    void set(const Affine3& m) { current_ = m; }

    Vec3 transformPoint(Vec3 p) const { return current_.transformPoint(p); }
    Point transformPoint2d(Point p) const;

    /// @brief Decompose the current transform for spawning a drawable.
    DrawTransform toDrawTransform() const { return DrawTransform::fromAffine(current_); }

private:
    Affine3 current_;
    std::vector<Affine3> saved_;
};

} // namespace brush
