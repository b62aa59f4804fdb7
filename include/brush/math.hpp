#pragma once

/**
 * @file math.hpp
 * @brief Small vector, quaternion and 3D affine types used by transforms and meshes.
 */

#include "brush/types.hpp"

namespace brush {

/// @brief A 2D vector.
struct Vec2 {
    f32 x = 0;
    f32 y = 0;

    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }
};

/// @brief A 3D vector.
struct Vec3 {
    f32 x = 0;
    f32 y = 0;
    f32 z = 0;

    Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vec3 operator*(f32 s) const { return {x * s, y * s, z * s}; }

    bool operator==(const Vec3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vec3& o) const { return !(*this == o); }

    f32 dot(const Vec3& o) const { return x * o.x + y * o.y + z * o.z; }
    Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    f32 length() const;
    /// @brief Unit vector in the same direction, or zero for a zero vector.
    Vec3 normalized() const;
};

/// @brief A 4-component vector (colors, custom attributes).
struct Vec4 {
    f32 x = 0;
    f32 y = 0;
    f32 z = 0;
    f32 w = 0;

    bool operator==(const Vec4& o) const { return x == o.x && y == o.y && z == o.z && w == o.w; }
    bool operator!=(const Vec4& o) const { return !(*this == o); }
};

/// @brief A rotation quaternion (x, y, z, w).
struct Quat {
    f32 x = 0;
    f32 y = 0;
    f32 z = 0;
    f32 w = 1;

    static Quat identity() { return {}; }
    /// @brief Rotation of angle radians about axis (normalized internally).
    static Quat fromAxisAngle(Vec3 axis, f32 angle);

    /// @brief Rotate a vector.
    Vec3 rotate(Vec3 v) const;
};

/// @brief A 3D affine transform: a 3x3 linear part (stored by columns) plus a translation.
///
/// Points are column vectors; `a * b` applies b first, then a.
struct Affine3 {
    Vec3 xAxis{1, 0, 0};     ///< First column of the linear part.
    Vec3 yAxis{0, 1, 0};     ///< Second column of the linear part.
    Vec3 zAxis{0, 0, 1};     ///< Third column of the linear part.
    Vec3 translation{};      ///< Translation.

    static Affine3 identity() { return {}; }
    static Affine3 fromTranslation(Vec3 t);
    static Affine3 fromScale(Vec3 s);
    static Affine3 fromRotationX(f32 angle);
    static Affine3 fromRotationY(f32 angle);
    static Affine3 fromRotationZ(f32 angle);
    static Affine3 fromAxisAngle(Vec3 axis, f32 angle);
    static Affine3 fromQuat(Quat q);
    /// @brief Horizontal shear: x' = x + tan(angle) * y.
    static Affine3 fromShearX(f32 angle);
    /// @brief Vertical shear: y' = y + tan(angle) * x.
    static Affine3 fromShearY(f32 angle);

    Affine3 operator*(const Affine3& rhs) const;

    Vec3 transformPoint(Vec3 p) const;
    Vec3 transformVector(Vec3 v) const;
    f32 determinant() const;

    bool isIdentity() const { return *this == Affine3{}; }

    bool operator==(const Affine3& o) const {
        return xAxis == o.xAxis && yAxis == o.yAxis && zAxis == o.zAxis &&
               translation == o.translation;
    }
    bool operator!=(const Affine3& o) const { return !(*this == o); }
};

/// @brief Translation/rotation/scale decomposition of an Affine3, as used to place a drawable.
///
/// Shear cannot be represented and is lost by fromAffine().
struct DrawTransform {
    Vec3 translation{};
    Quat rotation{};
    Vec3 scale{1, 1, 1};

    /// @brief Decompose an affine transform. A negative determinant flips the x scale.
    static DrawTransform fromAffine(const Affine3& m);

    /// @brief Recompose into an affine transform (translation * rotation * scale).
    Affine3 toAffine() const;
};

} // namespace brush
