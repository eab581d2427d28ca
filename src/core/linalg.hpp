#pragma once

/// @file linalg.hpp
/// @brief Small fixed-size linear algebra helpers used by the projection math.
///
/// Everything here is pure and stateless. Quaternions are stored scalar-first,
/// (w, x, y, z), and that order is relied on by quat_to_rotmat().

#include "core/types.hpp"

#include <Eigen/Core>

namespace gstile {

/// @brief Convert a unit quaternion (w, x, y, z) to a 3x3 rotation matrix.
///
/// Closed-form Hamilton convention. The quaternion is not normalised here;
/// callers pass unit quaternions.
inline Eigen::Matrix3f quat_to_rotmat(const Eigen::Vector4f& quat) {
    const float w = quat[0];
    const float x = quat[1];
    const float y = quat[2];
    const float z = quat[3];

    const float x2 = x * x, y2 = y * y, z2 = z * z;
    const float xy = x * y, xz = x * z, yz = y * z;
    const float wx = w * x, wy = w * y, wz = w * z;

    Eigen::Matrix3f r;
    r << 1.0f - 2.0f * (y2 + z2), 2.0f * (xy - wz),        2.0f * (xz + wy),
         2.0f * (xy + wz),        1.0f - 2.0f * (x2 + z2), 2.0f * (yz - wx),
         2.0f * (xz - wy),        2.0f * (yz + wx),        1.0f - 2.0f * (x2 + y2);
    return r;
}

/// @brief Diagonal matrix from three scale factors.
inline Eigen::Matrix3f scale_to_mat(const Eigen::Vector3f& scale) {
    return scale.asDiagonal();
}

/// @brief Inverse of a 2x2 matrix via adjugate / determinant.
///
/// No singularity check: the caller guarantees a non-zero determinant.
inline Eigen::Matrix2f inverse(const Eigen::Matrix2f& m) {
    const float det = m(0, 0) * m(1, 1) - m(0, 1) * m(1, 0);
    const float inv_det = 1.0f / det;
    Eigen::Matrix2f inv;
    inv << m(1, 1) * inv_det, -m(0, 1) * inv_det,
          -m(1, 0) * inv_det,  m(0, 0) * inv_det;
    return inv;
}

/// @brief Integer ceiling division for non-negative operands.
constexpr int ceil_div(int num, int denom) {
    return (num + denom - 1) / denom;
}

/// @brief Number of tiles needed to cover an image of the given size.
inline Eigen::Vector2i tile_bounds_for(const Eigen::Vector2i& img_size) {
    return {ceil_div(img_size.x(), kTileSize), ceil_div(img_size.y(), kTileSize)};
}

inline PackedVec3 to_packed(const Eigen::Vector3f& v) {
    return PackedVec3{v.x(), v.y(), v.z()};
}

inline Eigen::Vector3f from_packed(const PackedVec3& p) {
    return {p.x, p.y, p.z};
}

} // namespace gstile
