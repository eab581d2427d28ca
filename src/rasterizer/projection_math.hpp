#pragma once

/// @file projection_math.hpp
/// @brief Per-Gaussian projection math: 3D covariance, its propagation to
///        screen space through the perspective Jacobian, conic and opacity
///        compensation.
///
/// A 2D covariance or conic is stored as its three independent entries
/// (xx, xy, yy) in an Eigen::Vector3f.

#include "core/linalg.hpp"
#include "core/types.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace gstile {

/// @brief Perspective projection of a view-space point to pixel coordinates.
///
/// The 1e-6 keeps the divide finite at zero depth.
inline Eigen::Vector2f project_pixel(const Eigen::Vector2f& focal,
                                     const Eigen::Vector3f& view_pos,
                                     const Eigen::Vector2f& pixel_center) {
    const float rz = 1.0f / (view_pos.z() + 1e-6f);
    return focal.cwiseProduct(view_pos.head<2>() * rz) + pixel_center;
}

/// @brief 3D covariance V = R S S^T R^T from scale and (w, x, y, z) quaternion.
inline Eigen::Matrix3f build_cov3d(const Eigen::Vector3f& scale,
                                   const Eigen::Vector4f& quat) {
    const Eigen::Matrix3f m = quat_to_rotmat(quat) * scale_to_mat(scale);
    return m * m.transpose();
}

/// @brief Screen-space covariance of a Gaussian, with kCovBlur added to the
///        diagonal.
///
/// The view-space point is clamped to 1.3x the half field of view before the
/// Jacobian is evaluated. This only conditions the Jacobian for points near
/// or outside the frustum; it does not move the projected mean.
///
/// @param focal       (fx, fy) in pixels.
/// @param img_size    (width, height) in pixels.
/// @param view_matrix World-to-camera transform; only its rotation is used.
/// @param view_pos    Gaussian mean in view space.
/// @param scale       Activated scale.
/// @param quat        Unit quaternion (w, x, y, z).
/// @return (xx, xy, yy) of the 2D covariance.
inline Eigen::Vector3f calc_cov2d(const Eigen::Vector2f& focal,
                                  const Eigen::Vector2i& img_size,
                                  const Eigen::Matrix4f& view_matrix,
                                  const Eigen::Vector3f& view_pos,
                                  const Eigen::Vector3f& scale,
                                  const Eigen::Vector4f& quat) {
    const Eigen::Vector2f tan_fov = 0.5f * img_size.cast<float>().cwiseQuotient(focal);
    const Eigen::Vector2f lim = 1.3f * tan_fov;

    const float z = view_pos.z();
    const float rz = 1.0f / z;
    const float rz2 = rz * rz;
    const Eigen::Vector2f t =
        z * (view_pos.head<2>() * rz).cwiseMax(-lim).cwiseMin(lim);

    Eigen::Matrix3f j;
    j << focal.x() * rz, 0.0f,           -focal.x() * t.x() * rz2,
         0.0f,           focal.y() * rz, -focal.y() * t.y() * rz2,
         0.0f,           0.0f,           0.0f;

    const Eigen::Matrix3f w = view_matrix.topLeftCorner<3, 3>();
    const Eigen::Matrix3f tm = j * w;
    const Eigen::Matrix3f cov = tm * build_cov3d(scale, quat) * tm.transpose();

    return {cov(0, 0) + kCovBlur, cov(0, 1), cov(1, 1) + kCovBlur};
}

/// @brief Inverse of the symmetric 2x2 matrix [[x, y], [y, z]].
///
/// Undefined for a singular covariance; calc_cov2d()'s blur keeps the
/// determinant positive for well-formed input.
inline Eigen::Vector3f cov_to_conic(const Eigen::Vector3f& cov2d) {
    Eigen::Matrix2f m;
    m << cov2d.x(), cov2d.y(),
         cov2d.y(), cov2d.z();
    const Eigen::Matrix2f inv = inverse(m);
    return {inv(0, 0), inv(0, 1), inv(1, 1)};
}

/// @brief Opacity factor sqrt(det(cov2d - blur) / det(cov2d)), in [0, 1].
///
/// Attenuates splats whose footprint is mostly the artificial blur. A
/// negative ratio from rounding is clamped to 0.
inline float cov_compensation(const Eigen::Vector3f& cov2d) {
    const Eigen::Vector3f cov_orig = cov2d - Eigen::Vector3f(kCovBlur, 0.0f, kCovBlur);
    const float det_orig = cov_orig.x() * cov_orig.z() - cov_orig.y() * cov_orig.y();
    const float det = cov2d.x() * cov2d.z() - cov2d.y() * cov2d.y();
    return std::sqrt(std::max(0.0f, det_orig / det));
}

} // namespace gstile
