#include "brush/math.hpp"

#include <cmath>

namespace brush {

f32 Vec3::length() const {
    return std::sqrt(dot(*this));
}

Vec3 Vec3::normalized() const {
    f32 len = length();
    if (len <= 0.0f) return {};
    return *this * (1.0f / len);
}

// --- Quat ---

Quat Quat::fromAxisAngle(Vec3 axis, f32 angle) {
    Vec3 n = axis.normalized();
    f32 s = std::sin(angle * 0.5f);
    return {n.x * s, n.y * s, n.z * s, std::cos(angle * 0.5f)};
}

Vec3 Quat::rotate(Vec3 v) const {
    return Affine3::fromQuat(*this).transformVector(v);
}

// --- Affine3 ---

Affine3 Affine3::fromTranslation(Vec3 t) {
    Affine3 m;
    m.translation = t;
    return m;
}

Affine3 Affine3::fromScale(Vec3 s) {
    Affine3 m;
    m.xAxis = {s.x, 0, 0};
    m.yAxis = {0, s.y, 0};
    m.zAxis = {0, 0, s.z};
    return m;
}

Affine3 Affine3::fromRotationX(f32 angle) {
    f32 c = std::cos(angle), s = std::sin(angle);
    Affine3 m;
    m.yAxis = {0, c, s};
    m.zAxis = {0, -s, c};
    return m;
}

Affine3 Affine3::fromRotationY(f32 angle) {
    f32 c = std::cos(angle), s = std::sin(angle);
    Affine3 m;
    m.xAxis = {c, 0, -s};
    m.zAxis = {s, 0, c};
    return m;
}

Affine3 Affine3::fromRotationZ(f32 angle) {
    f32 c = std::cos(angle), s = std::sin(angle);
    Affine3 m;
    m.xAxis = {c, s, 0};
    m.yAxis = {-s, c, 0};
    return m;
}

Affine3 Affine3::fromAxisAngle(Vec3 axis, f32 angle) {
    Vec3 n = axis.normalized();
    f32 c = std::cos(angle), s = std::sin(angle), t = 1.0f - c;
    Affine3 m;
    m.xAxis = {t * n.x * n.x + c, t * n.x * n.y + s * n.z, t * n.x * n.z - s * n.y};
    m.yAxis = {t * n.x * n.y - s * n.z, t * n.y * n.y + c, t * n.y * n.z + s * n.x};
    m.zAxis = {t * n.x * n.z + s * n.y, t * n.y * n.z - s * n.x, t * n.z * n.z + c};
    return m;
}

Affine3 Affine3::fromQuat(Quat q) {
    f32 x2 = q.x + q.x, y2 = q.y + q.y, z2 = q.z + q.z;
    f32 xx = q.x * x2, xy = q.x * y2, xz = q.x * z2;
    f32 yy = q.y * y2, yz = q.y * z2, zz = q.z * z2;
    f32 wx = q.w * x2, wy = q.w * y2, wz = q.w * z2;
    Affine3 m;
    m.xAxis = {1.0f - (yy + zz), xy + wz, xz - wy};
    m.yAxis = {xy - wz, 1.0f - (xx + zz), yz + wx};
    m.zAxis = {xz + wy, yz - wx, 1.0f - (xx + yy)};
    return m;
}

Affine3 Affine3::fromShearX(f32 angle) {
    Affine3 m;
    m.yAxis = {std::tan(angle), 1, 0};
    return m;
}

Affine3 Affine3::fromShearY(f32 angle) {
    Affine3 m;
    m.xAxis = {1, std::tan(angle), 0};
    return m;
}

Affine3 Affine3::operator*(const Affine3& rhs) const {
    Affine3 out;
    out.xAxis = transformVector(rhs.xAxis);
    out.yAxis = transformVector(rhs.yAxis);
    out.zAxis = transformVector(rhs.zAxis);
    out.translation = transformPoint(rhs.translation);
    return out;
}

Vec3 Affine3::transformVector(Vec3 v) const {
    return xAxis * v.x + yAxis * v.y + zAxis * v.z;
}

Vec3 Affine3::transformPoint(Vec3 p) const {
    return transformVector(p) + translation;
}

f32 Affine3::determinant() const {
    return xAxis.dot(yAxis.cross(zAxis));
}

// --- DrawTransform ---

namespace {

Quat quatFromColumns(Vec3 c0, Vec3 c1, Vec3 c2) {
    f32 m00 = c0.x, m01 = c0.y, m02 = c0.z;
    f32 m10 = c1.x, m11 = c1.y, m12 = c1.z;
    f32 m20 = c2.x, m21 = c2.y, m22 = c2.z;
    if (m22 <= 0.0f) {
        f32 dif10 = m11 - m00;
        f32 omm22 = 1.0f - m22;
        if (dif10 <= 0.0f) {
            f32 fourXsq = omm22 - dif10;
            f32 inv = 0.5f / std::sqrt(fourXsq);
            return {fourXsq * inv, (m01 + m10) * inv, (m02 + m20) * inv, (m12 - m21) * inv};
        }
        f32 fourYsq = omm22 + dif10;
        f32 inv = 0.5f / std::sqrt(fourYsq);
        return {(m01 + m10) * inv, fourYsq * inv, (m12 + m21) * inv, (m20 - m02) * inv};
    }
    f32 sum10 = m11 + m00;
    f32 opm22 = 1.0f + m22;
    if (sum10 <= 0.0f) {
        f32 fourZsq = opm22 - sum10;
        f32 inv = 0.5f / std::sqrt(fourZsq);
        return {(m02 + m20) * inv, (m12 + m21) * inv, fourZsq * inv, (m01 - m10) * inv};
    }
    f32 fourWsq = opm22 + sum10;
    f32 inv = 0.5f / std::sqrt(fourWsq);
    return {(m12 - m21) * inv, (m20 - m02) * inv, (m01 - m10) * inv, fourWsq * inv};
}

Vec3 scaledAxis(Vec3 axis, f32 s) {
    return s != 0.0f ? axis * (1.0f / s) : Vec3{};
}

}

DrawTransform DrawTransform::fromAffine(const Affine3& m) {
    f32 det = m.determinant();
    DrawTransform out;
    out.scale = {m.xAxis.length() * (det < 0.0f ? -1.0f : 1.0f),
                 m.yAxis.length(),
                 m.zAxis.length()};
    out.rotation = quatFromColumns(scaledAxis(m.xAxis, out.scale.x),
                                   scaledAxis(m.yAxis, out.scale.y),
                                   scaledAxis(m.zAxis, out.scale.z));
    out.translation = m.translation;
    return out;
}

Affine3 DrawTransform::toAffine() const {
    return Affine3::fromTranslation(translation) * Affine3::fromQuat(rotation) *
           Affine3::fromScale(scale);
}

} // namespace brush
