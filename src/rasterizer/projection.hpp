#pragma once

/// @file projection.hpp
/// @brief Projection stage: 3D Gaussians -> compacted screen-space splats.
///
/// One independent worker per Gaussian runs the projection math, sizes the
/// coarse tile box and counts the tiles that pass the exact visibility test.
/// Visible splats claim an output slot from the frame's VisibleCounter, so
/// outputs are ordered by claim, not by input index.

#include <torch/torch.h>

#include "core/frame_state.hpp"
#include "core/gaussian.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <optional>

namespace gstile {

/// @brief Everything one worker computes for a visible Gaussian.
struct SplatProjection {
    ProjectedSplat splat;        ///< Packed output record
    float depth = 0.0f;          ///< View-space z
    int radius = 0;              ///< 3-sigma pixel radius
    TileBoundingBox tile_bbox;   ///< Coarse candidate tiles
    int tiles_hit = 0;           ///< Tiles in tile_bbox passing the exact test
};

/// @brief Project a single Gaussian.
///
/// @return The projection, or std::nullopt if the Gaussian is closer than
///         frame.near_clip or reaches no tile.
std::optional<SplatProjection> project_splat(const Gaussian3D& gaussian,
                                             const FrameUniforms& frame);

/// @brief Output of the projection stage.
///
/// All tensors are CPU and hold num_visible rows, indexed by compact id
/// (the slot claimed from the counter).
struct ProjectionOutput {
    torch::Tensor xys;                     ///< Pixel positions [V, 2], float32
    torch::Tensor depths;                  ///< View-space depth [V], float32
    torch::Tensor conics;                  ///< Inverse 2D covariance [V, 3] (xx, xy, yy)
    torch::Tensor colors;                  ///< RGB + compensated alpha [V, 4]
    torch::Tensor radii;                   ///< Pixel radius [V], int32
    torch::Tensor num_tiles_hit;           ///< Exactly visible tiles [V], int32
    torch::Tensor global_from_compact_gid; ///< Input index per compact id [V], int32
    int64_t num_visible = 0;

    /// @brief Packed record for one compact id.
    ProjectedSplat splat(int64_t compact_gid) const;
};

/// @brief Project all Gaussians of a model for one frame.
///
/// Runs one worker per Gaussian with tbb::parallel_for (grain kBatchSize).
/// The counter must be unsealed and hold no claims on entry; it is sealed once
/// every worker has finished, and its value equals the returned num_visible.
/// With validate_inputs, a Gaussian that is not well-formed after activation
/// rejects the whole frame.
///
/// @param model    Gaussian model (any device; copied to CPU float32).
/// @param frame    Frame uniforms; total_splats must match the model size.
/// @param counter  Visible-splat counter for this frame.
/// @param settings scale_modifier and validate_inputs are used.
ProjectionOutput project_gaussians(const GaussianModel& model,
                                   const FrameUniforms& frame,
                                   VisibleCounter& counter,
                                   const RenderSettings& settings = {});

/// @brief Convenience overload that builds the frame state from a camera.
ProjectionOutput project_gaussians(const GaussianModel& model,
                                   const CameraInfo& camera,
                                   const RenderSettings& settings = {});

} // namespace gstile
