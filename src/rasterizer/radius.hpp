#pragma once

/// @file radius.hpp
/// @brief Pixel radius of a projected Gaussian and the clamped pixel / tile
///        boxes derived from it.

#include "core/types.hpp"
#include "rasterizer/projection_math.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace gstile {

/// @brief 3-sigma pixel radius of the Gaussian described by a conic.
///
/// The radius does not depend on opacity, so faint splats get the same
/// footprint as opaque ones. The exact tile test in tile_binning.hpp is what
/// tightens coverage; this only sizes the candidate box.
///
/// The eigenvalue discriminant is floored at 0.1 so near-isotropic matrices
/// never take the square root of a rounding-negative value.
inline int radius_from_conic(const Eigen::Vector3f& conic, float /*opacity*/) {
    const Eigen::Vector3f cov2d = cov_to_conic(conic);
    const float det = cov2d.x() * cov2d.z() - cov2d.y() * cov2d.y();
    const float b = 0.5f * (cov2d.x() + cov2d.z());
    const float disc = std::sqrt(std::max(0.1f, b * b - det));
    const float v1 = b + disc;
    const float v2 = b - disc;
    return static_cast<int>(std::ceil(3.0f * std::sqrt(std::max(0.0f, std::max(v1, v2)))));
}

/// @brief Integer box around center, clamped to [0, bounds].
///
/// min = floor(center - half_dims), max = ceil(center + half_dims + 1). The
/// +1 keeps the box at least one unit wide when half_dims is 0, unless
/// clamping pushes it entirely off the grid.
inline TileBoundingBox get_bbox(const Eigen::Vector2f& center,
                                const Eigen::Vector2f& half_dims,
                                const Eigen::Vector2i& bounds) {
    auto clamp_to = [](float v, int bound) {
        return static_cast<int>(std::clamp(v, 0.0f, static_cast<float>(bound)));
    };

    const Eigen::Vector2f lo = center - half_dims;
    const Eigen::Vector2f hi = center + half_dims + Eigen::Vector2f::Ones();

    TileBoundingBox box;
    box.min_x = clamp_to(std::floor(lo.x()), bounds.x());
    box.min_y = clamp_to(std::floor(lo.y()), bounds.y());
    box.max_x = clamp_to(std::ceil(hi.x()), bounds.x());
    box.max_y = clamp_to(std::ceil(hi.y()), bounds.y());
    return box;
}

/// @brief Coarse tile box covering a pixel-space circle.
inline TileBoundingBox get_tile_bbox(const Eigen::Vector2f& pixel_center,
                                     int pixel_radius,
                                     const Eigen::Vector2i& tile_bounds) {
    const float tile = static_cast<float>(kTileSize);
    const float r = static_cast<float>(pixel_radius) / tile;
    return get_bbox(pixel_center / tile, Eigen::Vector2f(r, r), tile_bounds);
}

} // namespace gstile
