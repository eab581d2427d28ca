/// @file projection.cpp
/// @brief CPU projection stage.

#include "rasterizer/projection.hpp"
#include "rasterizer/projection_math.hpp"
#include "rasterizer/radius.hpp"
#include "rasterizer/tile_visibility.hpp"

#include <Eigen/Geometry>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include <atomic>

namespace gstile {

namespace {

void check_finite(const torch::Tensor& t, const char* name) {
    TORCH_CHECK(torch::isfinite(t).all().item<bool>(),
                name, " contains non-finite values");
}

} // namespace

std::optional<SplatProjection> project_splat(const Gaussian3D& gaussian,
                                             const FrameUniforms& frame) {
    const Eigen::Vector4f view_h = frame.view_matrix * gaussian.position.homogeneous();
    const Eigen::Vector3f view_pos = view_h.head<3>();
    if (view_pos.z() < frame.near_clip) {
        return std::nullopt;
    }

    const Eigen::Vector2f xy = project_pixel(frame.focal, view_pos, frame.pixel_center);
    const Eigen::Vector3f cov2d = calc_cov2d(frame.focal, frame.img_size, frame.view_matrix,
                                             view_pos, gaussian.scale, gaussian.rotation);
    const Eigen::Vector3f conic = cov_to_conic(cov2d);
    const float opacity = gaussian.opacity * cov_compensation(cov2d);

    const int radius = radius_from_conic(conic, opacity);
    const TileBoundingBox tile_bbox = get_tile_bbox(xy, radius, frame.tile_bounds);
    if (tile_bbox.empty()) {
        return std::nullopt;
    }

    const int tiles_hit = count_visible_tiles(tile_bbox, xy, conic, opacity);
    if (tiles_hit == 0) {
        return std::nullopt;
    }

    SplatProjection out;
    out.splat.xy[0] = xy.x();
    out.splat.xy[1] = xy.y();
    out.splat.conic = to_packed(conic);
    // Premultiplied by alpha.
    out.splat.color[0] = gaussian.color.x() * opacity;
    out.splat.color[1] = gaussian.color.y() * opacity;
    out.splat.color[2] = gaussian.color.z() * opacity;
    out.splat.color[3] = opacity;
    out.depth = view_pos.z();
    out.radius = radius;
    out.tile_bbox = tile_bbox;
    out.tiles_hit = tiles_hit;
    return out;
}

ProjectedSplat ProjectionOutput::splat(int64_t compact_gid) const {
    TORCH_CHECK(compact_gid >= 0 && compact_gid < num_visible,
                "compact id ", compact_gid, " out of range [0, ", num_visible, ")");
    auto xy_acc = xys.accessor<float, 2>();
    auto conic_acc = conics.accessor<float, 2>();
    auto color_acc = colors.accessor<float, 2>();

    ProjectedSplat s;
    s.xy[0] = xy_acc[compact_gid][0];
    s.xy[1] = xy_acc[compact_gid][1];
    s.conic = PackedVec3{conic_acc[compact_gid][0], conic_acc[compact_gid][1],
                         conic_acc[compact_gid][2]};
    for (int c = 0; c < 4; ++c) {
        s.color[c] = color_acc[compact_gid][c];
    }
    return s;
}

ProjectionOutput project_gaussians(const GaussianModel& model,
                                   const FrameUniforms& frame,
                                   VisibleCounter& counter,
                                   const RenderSettings& settings) {
    TORCH_CHECK(model.is_valid(), "GaussianModel is not valid");

    const int64_t n = model.num_gaussians();
    TORCH_CHECK(frame.total_splats == n,
                "Frame expects ", frame.total_splats, " splats but model has ", n);
    TORCH_CHECK(frame.focal.x() > 0.0f && frame.focal.y() > 0.0f,
                "Focal length must be positive");

    auto to_cpu = [](const torch::Tensor& t) {
        return t.to(torch::kCPU, torch::kFloat32).contiguous();
    };
    auto positions = to_cpu(model.positions);
    auto colors_in = to_cpu(model.colors);
    auto opacities = to_cpu(model.opacities);
    auto rotations = to_cpu(model.rotations);
    auto scales    = to_cpu(model.scales);

    if (settings.validate_inputs) {
        check_finite(positions, "positions");
        check_finite(colors_in, "colors");
        check_finite(opacities, "opacities");
        check_finite(rotations, "rotations");
        check_finite(scales, "scales");
    }

    auto opts_f = torch::TensorOptions().dtype(torch::kFloat32);
    auto opts_i = torch::TensorOptions().dtype(torch::kInt32);

    auto xys          = torch::zeros({n, 2}, opts_f);
    auto depths       = torch::zeros({n}, opts_f);
    auto conics       = torch::zeros({n, 3}, opts_f);
    auto colors       = torch::zeros({n, 4}, opts_f);
    auto radii        = torch::zeros({n}, opts_i);
    auto tiles_hit    = torch::zeros({n}, opts_i);
    auto global_gid   = torch::zeros({n}, opts_i);

    const float* pos_ptr = positions.data_ptr<float>();
    const float* col_in_ptr = colors_in.data_ptr<float>();
    const float* opa_ptr = opacities.data_ptr<float>();
    const float* rot_ptr = rotations.data_ptr<float>();
    const float* scl_ptr = scales.data_ptr<float>();

    float* xys_ptr = xys.data_ptr<float>();
    float* depth_ptr = depths.data_ptr<float>();
    float* conic_ptr = conics.data_ptr<float>();
    float* color_ptr = colors.data_ptr<float>();
    int32_t* radii_ptr = radii.data_ptr<int32_t>();
    int32_t* hit_ptr = tiles_hit.data_ptr<int32_t>();
    int32_t* gid_ptr = global_gid.data_ptr<int32_t>();

    // Lowest index of an ill-formed Gaussian, or -1.
    std::atomic<int64_t> first_bad{-1};
    auto record_bad = [&first_bad](int64_t i) {
        int64_t cur = first_bad.load(std::memory_order_relaxed);
        while ((cur < 0 || i < cur) &&
               !first_bad.compare_exchange_weak(cur, i, std::memory_order_relaxed)) {
        }
    };

    VisibleCounter::Claimer claimer = counter.claimer();
    // Slots index buffers of n rows, so numbering must start at zero.
    TORCH_CHECK(counter.claimed() == 0,
                "VisibleCounter already holds ", counter.claimed(),
                " claims; reset() it before projecting a frame");

    tbb::parallel_for(
        tbb::blocked_range<int64_t>(0, n, kBatchSize),
        [&](const tbb::blocked_range<int64_t>& range) {
            for (int64_t i = range.begin(); i < range.end(); ++i) {
                const Gaussian3D g = activate_gaussian(
                    pos_ptr + 3 * i, scl_ptr + 3 * i, rot_ptr + 4 * i,
                    opa_ptr[i], col_in_ptr + 3 * i, settings.scale_modifier);
                if (settings.validate_inputs && !g.is_well_formed()) {
                    record_bad(i);
                    continue;
                }

                const auto proj = project_splat(g, frame);
                if (!proj) continue;

                const int64_t slot = claimer.claim();
                xys_ptr[2 * slot + 0] = proj->splat.xy[0];
                xys_ptr[2 * slot + 1] = proj->splat.xy[1];
                conic_ptr[3 * slot + 0] = proj->splat.conic.x;
                conic_ptr[3 * slot + 1] = proj->splat.conic.y;
                conic_ptr[3 * slot + 2] = proj->splat.conic.z;
                for (int c = 0; c < 4; ++c) {
                    color_ptr[4 * slot + c] = proj->splat.color[c];
                }
                depth_ptr[slot] = proj->depth;
                radii_ptr[slot] = proj->radius;
                hit_ptr[slot] = proj->tiles_hit;
                gid_ptr[slot] = static_cast<int32_t>(i);
            }
        });

    // parallel_for has joined every worker; the count is final.
    const int64_t num_visible = counter.seal();
    TORCH_CHECK(first_bad.load() < 0, "Gaussian ", first_bad.load(),
                " is ill-formed after activation (zero scale, zero opacity or"
                " degenerate rotation)");

    spdlog::debug("Projection: {} / {} Gaussians visible ({}x{} tiles)",
                  num_visible, n, frame.tile_bounds.x(), frame.tile_bounds.y());

    return ProjectionOutput{
        /*xys=*/                     xys.slice(0, 0, num_visible),
        /*depths=*/                  depths.slice(0, 0, num_visible),
        /*conics=*/                  conics.slice(0, 0, num_visible),
        /*colors=*/                  colors.slice(0, 0, num_visible),
        /*radii=*/                   radii.slice(0, 0, num_visible),
        /*num_tiles_hit=*/           tiles_hit.slice(0, 0, num_visible),
        /*global_from_compact_gid=*/ global_gid.slice(0, 0, num_visible),
        /*num_visible=*/             num_visible,
    };
}

ProjectionOutput project_gaussians(const GaussianModel& model,
                                   const CameraInfo& camera,
                                   const RenderSettings& settings) {
    const FrameUniforms frame = make_frame_uniforms(camera, settings, model.num_gaussians());
    VisibleCounter counter;
    return project_gaussians(model, frame, counter, settings);
}

} // namespace gstile
