#pragma once

/// @file binning_stats.hpp
/// @brief Summary statistics of one projected and binned frame.

#include "core/frame_state.hpp"
#include "rasterizer/projection.hpp"
#include "rasterizer/tile_binning.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace gstile {

struct BinningStats {
    int64_t num_gaussians = 0;
    int64_t num_visible = 0;
    int64_t num_intersects = 0;
    int num_tiles = 0;
    int occupied_tiles = 0;          ///< Tiles with at least one splat
    int max_splats_per_tile = 0;
    float mean_splats_per_tile = 0;  ///< Over occupied tiles only
    float mean_tiles_per_splat = 0;
    float projection_ms = 0.0f;
    float binning_ms = 0.0f;

    /// @brief Serialize to JSON string (pretty-printed).
    std::string to_json() const;

    /// @brief Write JSON to file.
    /// @return true on success.
    bool save_json(const std::filesystem::path& path) const;
};

/// @brief Aggregate per-tile and per-splat counts for a frame.
BinningStats compute_binning_stats(const ProjectionOutput& projection,
                                   const TileIntersections& intersections,
                                   const FrameUniforms& frame);

} // namespace gstile
