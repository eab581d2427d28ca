#pragma once

/// @file tile_binning.hpp
/// @brief Expand projected splats into (tile, splat) intersection pairs.
///
/// After projection each visible splat knows how many tiles it exactly
/// reaches. An inclusive prefix sum over those counts gives each splat a
/// write range, and one worker per splat emits a (tile_id, compact_gid) pair
/// for every tile that passes can_be_visible(). The pairs are handed to an
/// external sort / compositing stage; no ordering across splats is implied.

#include <torch/torch.h>

#include "core/frame_state.hpp"
#include "rasterizer/projection.hpp"

#include <cstdint>

namespace gstile {

/// @brief (tile, splat) pairs for one frame.
struct TileIntersections {
    torch::Tensor tile_id_from_isect;      ///< Tile id (y * tiles_x + x) [P], int32
    torch::Tensor compact_gid_from_isect;  ///< Compact splat id [P], int32
    torch::Tensor cum_tiles_hit;           ///< Inclusive prefix sum of tiles hit [V], int32
    int64_t num_intersects = 0;            ///< P
};

/// @brief Emit every (tile, splat) pair that passes the exact visibility test.
///
/// Pairs of splat i occupy [cum_tiles_hit[i] - num_tiles_hit[i], cum_tiles_hit[i])
/// and list its tiles in row-major order.
///
/// @param projection Output of project_gaussians().
/// @param frame      Frame uniforms used for that projection.
TileIntersections map_gaussians_to_intersects(const ProjectionOutput& projection,
                                              const FrameUniforms& frame);

/// @brief Number of splats intersecting each tile [num_tiles], int32.
torch::Tensor tile_counts(const TileIntersections& intersections, int num_tiles);

} // namespace gstile
