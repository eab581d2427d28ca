#include "rasterizer/binning_stats.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace gstile {

BinningStats compute_binning_stats(const ProjectionOutput& projection,
                                   const TileIntersections& intersections,
                                   const FrameUniforms& frame) {
    BinningStats stats;
    stats.num_gaussians = frame.total_splats;
    stats.num_visible = projection.num_visible;
    stats.num_intersects = intersections.num_intersects;
    stats.num_tiles = frame.num_tiles();

    if (stats.num_intersects == 0) {
        return stats;
    }

    auto counts = tile_counts(intersections, stats.num_tiles);
    stats.occupied_tiles = counts.gt(0).sum().item<int>();
    stats.max_splats_per_tile = counts.max().item<int>();
    stats.mean_splats_per_tile =
        static_cast<float>(stats.num_intersects) / static_cast<float>(stats.occupied_tiles);
    stats.mean_tiles_per_splat =
        static_cast<float>(stats.num_intersects) / static_cast<float>(stats.num_visible);
    return stats;
}

// ---------------------------------------------------------------------------
// BinningStats::to_json
// ---------------------------------------------------------------------------

std::string BinningStats::to_json() const {
    nlohmann::json j;
    j["num_gaussians"] = num_gaussians;
    j["num_visible"] = num_visible;
    j["num_intersects"] = num_intersects;
    j["num_tiles"] = num_tiles;
    j["occupied_tiles"] = occupied_tiles;
    j["max_splats_per_tile"] = max_splats_per_tile;
    j["mean_splats_per_tile"] = mean_splats_per_tile;
    j["mean_tiles_per_splat"] = mean_tiles_per_splat;
    j["projection_ms"] = projection_ms;
    j["binning_ms"] = binning_ms;
    return j.dump(2);
}

// ---------------------------------------------------------------------------
// BinningStats::save_json
// ---------------------------------------------------------------------------

bool BinningStats::save_json(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open {} for writing", path.string());
        return false;
    }
    ofs << to_json() << "\n";
    spdlog::info("Saved binning stats to {}", path.string());
    return true;
}

} // namespace gstile
