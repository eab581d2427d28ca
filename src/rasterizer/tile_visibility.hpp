#pragma once

/// @file tile_visibility.hpp
/// @brief Exact test of whether a projected Gaussian can contribute to a tile.
///
/// A splat contributes to a pixel where opacity * exp(-sigma) >= 1/255, with
/// sigma = 0.5 * d^T C d for pixel offset d and conic C. The boundary of that
/// region is an ellipse; a tile is kept if the ellipse and the tile's
/// axis-aligned box intersect. This is tighter than the 3-sigma circle used
/// for the coarse box in radius.hpp.

#include "core/types.hpp"

#include <Eigen/Core>

#include <cmath>

namespace gstile {

/// @brief d^T C d for the symmetric conic (xx, xy, yy).
inline float quadratic_form(const Eigen::Vector2f& d, const Eigen::Vector3f& conic) {
    return conic.x() * d.x() * d.x() +
           2.0f * conic.y() * d.x() * d.y() +
           conic.z() * d.y() * d.y();
}

/// @brief C * d for the symmetric conic (xx, xy, yy).
inline Eigen::Vector2f conic_mul(const Eigen::Vector3f& conic, const Eigen::Vector2f& d) {
    return {conic.x() * d.x() + conic.y() * d.y(),
            conic.y() * d.x() + conic.z() * d.y()};
}

/// @brief Does the segment p0 -> p1 cross the ellipse boundary?
///
/// Substituting p(t) = p0 + t (p1 - p0) into the quadratic form gives
/// q2 t^2 + 2 q1 t + q0 = 0; the edge crosses if a real root lies in [0, 1].
///
/// @param p0    Segment start.
/// @param p1    Segment end.
/// @param q0    (p0 - c)^T C (p0 - c) - 1, c the ellipse center.
/// @param mp0   C (p0 - c).
/// @param conic Ellipse quadratic form (xx, xy, yy).
///
/// q2 == 0 (edge direction in the null space of C) is not special-cased:
/// the roots become inf/NaN and the test reports no crossing.
inline bool ellipse_overlaps_edge(const Eigen::Vector2f& p0,
                                  const Eigen::Vector2f& p1,
                                  float q0,
                                  const Eigen::Vector2f& mp0,
                                  const Eigen::Vector3f& conic) {
    const Eigen::Vector2f d = p1 - p0;
    const float q1 = d.dot(mp0);
    const float q2 = quadratic_form(d, conic);

    const float disc = q1 * q1 - q2 * q0;
    if (disc < 0.0f) return false;

    const float sq = std::sqrt(disc);
    const float t1 = (-q1 - sq) / q2;
    const float t2 = (-q1 + sq) / q2;
    return (t1 >= 0.0f && t1 <= 1.0f) || (t2 >= 0.0f && t2 <= 1.0f);
}

/// @brief Exact intersection of the ellipse d^T C d <= 1 (centered at
///        ellipse_center) with an axis-aligned box.
///
/// Checks, in order: ellipse center inside the box, any box corner inside the
/// ellipse, any box edge crossing the ellipse boundary.
inline bool ellipse_intersects_aabb(const Eigen::Vector2f& box_center,
                                    const Eigen::Vector2f& box_half_extent,
                                    const Eigen::Vector2f& ellipse_center,
                                    const Eigen::Vector3f& ellipse_conic) {
    const Eigen::Vector2f delta = ellipse_center - box_center;
    if (std::abs(delta.x()) <= box_half_extent.x() &&
        std::abs(delta.y()) <= box_half_extent.y()) {
        return true;
    }

    const float hx = box_half_extent.x();
    const float hy = box_half_extent.y();
    const Eigen::Vector2f corners[4] = {
        box_center + Eigen::Vector2f(-hx, -hy),
        box_center + Eigen::Vector2f( hx, -hy),
        box_center + Eigen::Vector2f( hx,  hy),
        box_center + Eigen::Vector2f(-hx,  hy),
    };

    for (const auto& corner : corners) {
        if (quadratic_form(corner - ellipse_center, ellipse_conic) <= 1.0f) {
            return true;
        }
    }

    for (int i = 0; i < 4; ++i) {
        const Eigen::Vector2f& p0 = corners[i];
        const Eigen::Vector2f& p1 = corners[(i + 1) % 4];
        const Eigen::Vector2f rel = p0 - ellipse_center;
        const float q0 = quadratic_form(rel, ellipse_conic) - 1.0f;
        const Eigen::Vector2f mp0 = conic_mul(ellipse_conic, rel);
        if (ellipse_overlaps_edge(p0, p1, q0, mp0, ellipse_conic)) {
            return true;
        }
    }

    return false;
}

/// @brief Pixel-space center of a tile.
inline Eigen::Vector2f tile_center(const Eigen::Vector2i& tile) {
    const float half = 0.5f * static_cast<float>(kTileSize);
    return tile.cast<float>() * static_cast<float>(kTileSize) + Eigen::Vector2f(half, half);
}

/// @brief Can the splat reach alpha >= 1/255 anywhere inside the tile?
///
/// @param tile    Tile index (x, y).
/// @param xy      Projected mean in pixels.
/// @param conic   Inverse 2D covariance (xx, xy, yy).
/// @param opacity Compensated opacity.
inline bool can_be_visible(const Eigen::Vector2i& tile,
                           const Eigen::Vector2f& xy,
                           const Eigen::Vector3f& conic,
                           float opacity) {
    // opacity * exp(-sigma) = threshold  <=>  sigma = ln(opacity / threshold)
    const float sigma = std::log(opacity / kVisibilityThreshold);
    if (sigma <= 0.0f) return false;

    const Eigen::Vector3f conic_scaled = conic / (2.0f * sigma);
    const float half = 0.5f * static_cast<float>(kTileSize);
    return ellipse_intersects_aabb(tile_center(tile), Eigen::Vector2f(half, half),
                                   xy, conic_scaled);
}

/// @brief Call fn(x, y) for every tile of the coarse box the splat can reach,
///        in row-major order.
template <typename Fn>
inline void for_each_visible_tile(const TileBoundingBox& bbox,
                                  const Eigen::Vector2f& xy,
                                  const Eigen::Vector3f& conic,
                                  float opacity,
                                  Fn&& fn) {
    for (int ty = bbox.min_y; ty < bbox.max_y; ++ty) {
        for (int tx = bbox.min_x; tx < bbox.max_x; ++tx) {
            if (can_be_visible(Eigen::Vector2i(tx, ty), xy, conic, opacity)) {
                fn(tx, ty);
            }
        }
    }
}

/// @brief Number of tiles in the coarse box that pass can_be_visible().
inline int count_visible_tiles(const TileBoundingBox& bbox,
                               const Eigen::Vector2f& xy,
                               const Eigen::Vector3f& conic,
                               float opacity) {
    int count = 0;
    for_each_visible_tile(bbox, xy, conic, opacity, [&count](int, int) { ++count; });
    return count;
}

} // namespace gstile
