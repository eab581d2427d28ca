#include "rasterizer/tile_binning.hpp"
#include "rasterizer/radius.hpp"
#include "rasterizer/tile_visibility.hpp"

#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace gstile {

TileIntersections map_gaussians_to_intersects(const ProjectionOutput& projection,
                                              const FrameUniforms& frame) {
    const int64_t v = projection.num_visible;
    auto opts_i = torch::TensorOptions().dtype(torch::kInt32);

    if (v == 0) {
        return TileIntersections{
            /*tile_id_from_isect=*/     torch::empty({0}, opts_i),
            /*compact_gid_from_isect=*/ torch::empty({0}, opts_i),
            /*cum_tiles_hit=*/          torch::empty({0}, opts_i),
            /*num_intersects=*/         0,
        };
    }

    auto num_tiles_hit = projection.num_tiles_hit.to(torch::kInt32).contiguous();
    auto cum_tiles_hit = torch::cumsum(num_tiles_hit, 0, torch::kInt32).contiguous();
    const int64_t num_intersects = cum_tiles_hit[v - 1].item<int32_t>();

    auto tile_ids = torch::empty({num_intersects}, opts_i);
    auto compact_gids = torch::empty({num_intersects}, opts_i);

    auto xys = projection.xys.contiguous();
    auto conics = projection.conics.contiguous();
    auto colors = projection.colors.contiguous();
    auto radii = projection.radii.to(torch::kInt32).contiguous();

    const float* xy_ptr = xys.data_ptr<float>();
    const float* conic_ptr = conics.data_ptr<float>();
    const float* color_ptr = colors.data_ptr<float>();
    const int32_t* radii_ptr = radii.data_ptr<int32_t>();
    const int32_t* hit_ptr = num_tiles_hit.data_ptr<int32_t>();
    const int32_t* cum_ptr = cum_tiles_hit.data_ptr<int32_t>();
    int32_t* tile_ptr = tile_ids.data_ptr<int32_t>();
    int32_t* gid_ptr = compact_gids.data_ptr<int32_t>();

    const int tiles_x = frame.tile_bounds.x();

    tbb::parallel_for(
        tbb::blocked_range<int64_t>(0, v, kBatchSize),
        [&](const tbb::blocked_range<int64_t>& range) {
            for (int64_t i = range.begin(); i < range.end(); ++i) {
                const Eigen::Vector2f xy(xy_ptr[2 * i], xy_ptr[2 * i + 1]);
                const Eigen::Vector3f conic(conic_ptr[3 * i], conic_ptr[3 * i + 1],
                                            conic_ptr[3 * i + 2]);
                const float opacity = color_ptr[4 * i + 3];
                const TileBoundingBox bbox = get_tile_bbox(xy, radii_ptr[i], frame.tile_bounds);

                const int64_t end = cum_ptr[i];
                int64_t k = end - hit_ptr[i];
                for_each_visible_tile(bbox, xy, conic, opacity, [&](int tx, int ty) {
                    if (k < end) {
                        tile_ptr[k] = ty * tiles_x + tx;
                        gid_ptr[k] = static_cast<int32_t>(i);
                        ++k;
                    }
                });
            }
        });

    spdlog::debug("Tile binning: {} intersections for {} visible splats", num_intersects, v);

    return TileIntersections{
        /*tile_id_from_isect=*/     tile_ids,
        /*compact_gid_from_isect=*/ compact_gids,
        /*cum_tiles_hit=*/          cum_tiles_hit,
        /*num_intersects=*/         num_intersects,
    };
}

torch::Tensor tile_counts(const TileIntersections& intersections, int num_tiles) {
    TORCH_CHECK(num_tiles >= 0, "num_tiles must be non-negative");
    if (intersections.num_intersects == 0) {
        return torch::zeros({num_tiles}, torch::kInt32);
    }
    return torch::bincount(intersections.tile_id_from_isect.to(torch::kInt64),
                           /*weights=*/{}, num_tiles)
        .to(torch::kInt32);
}

} // namespace gstile
