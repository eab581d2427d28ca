/// @file bin_tiles_main.cpp
/// @brief CLI entry point: project a Gaussian model for one camera and bin it
///        into 16x16 tiles.
///
/// Usage:
///   bin_tiles -m <model.ply> -c <frame.json> [-o <stats.json>] [--threads <N>]
///             [--no-validate] [-v]

#include "core/frame_state.hpp"
#include "core/gaussian.hpp"
#include "data/frame_config.hpp"
#include "rasterizer/binning_stats.hpp"
#include "rasterizer/projection.hpp"
#include "rasterizer/tile_binning.hpp"
#include "utils/cli_args.hpp"

#include <spdlog/spdlog.h>
#include <tbb/global_control.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout
        << "Gaussian splat tile binning\n"
        << "\n"
        << "Usage: " << program << " -m <model.ply> -c <frame.json> [options]\n"
        << "\n"
        << "Required:\n"
        << "  -m, --model <path>        Gaussian model in 3DGS PLY layout\n"
        << "  -c, --camera <path>       Frame config (camera + render settings) JSON\n"
        << "\n"
        << "Options:\n"
        << "  -o, --output <path>       Write binning statistics as JSON\n"
        << "  --threads <N>             Maximum worker threads (default: all cores)\n"
        << "  --no-validate             Skip the finite and well-formed checks on inputs\n"
        << "  -v, --verbose             Debug logging\n"
        << "  -h, --help                Show this help message\n";
}

using gstile::arg_matches;

float elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<float, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path model_path;
    std::filesystem::path config_path;
    std::filesystem::path output_path;
    int threads = 0;
    bool no_validate = false;

    for (int i = 1; i < argc; ++i) {
        if (arg_matches(argv[i], "-h", "--help")) {
            print_usage(argv[0]);
            return 0;
        }
        if (arg_matches(argv[i], "-m", "--model") && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg_matches(argv[i], "-c", "--camera") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg_matches(argv[i], "-o", "--output") && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg_matches(argv[i], nullptr, "--threads") && i + 1 < argc) {
            const auto parsed = gstile::parse_thread_count(argv[++i]);
            if (!parsed) {
                spdlog::error("--threads expects a non-negative integer, got '{}'", argv[i]);
                return 1;
            }
            threads = *parsed;
        } else if (arg_matches(argv[i], nullptr, "--no-validate")) {
            no_validate = true;
        } else if (arg_matches(argv[i], "-v", "--verbose")) {
            spdlog::set_level(spdlog::level::debug);
        } else {
            spdlog::error("Unknown argument: {}", argv[i]);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (model_path.empty()) {
        spdlog::error("Model path is required (-m / --model)");
        print_usage(argv[0]);
        return 1;
    }
    if (config_path.empty()) {
        spdlog::error("Frame config is required (-c / --camera)");
        print_usage(argv[0]);
        return 1;
    }
    std::unique_ptr<tbb::global_control> thread_limit;
    if (threads > 0) {
        thread_limit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<size_t>(threads));
        spdlog::info("Worker threads limited to {}", threads);
    }

    try {
        auto model = gstile::GaussianModel::load_ply(model_path);
        auto config = gstile::load_frame_config(config_path);
        if (no_validate) {
            config.render.validate_inputs = false;
        }

        const auto frame = gstile::make_frame_uniforms(
            config.camera, config.render, model.num_gaussians());
        gstile::VisibleCounter counter;

        auto t0 = std::chrono::steady_clock::now();
        auto projection = gstile::project_gaussians(model, frame, counter, config.render);
        const float projection_ms = elapsed_ms(t0);

        t0 = std::chrono::steady_clock::now();
        auto intersections = gstile::map_gaussians_to_intersects(projection, frame);
        const float binning_ms = elapsed_ms(t0);

        auto stats = gstile::compute_binning_stats(projection, intersections, frame);
        stats.projection_ms = projection_ms;
        stats.binning_ms = binning_ms;

        std::cout << "\n";
        std::cout << "=== Tile Binning ===\n";
        std::cout << "  Gaussians:        " << stats.num_gaussians << "\n";
        std::cout << "  Visible:          " << stats.num_visible << "\n";
        std::cout << "  Tiles:            " << frame.tile_bounds.x() << " x "
                  << frame.tile_bounds.y() << " (" << stats.occupied_tiles << " occupied)\n";
        std::cout << "  Intersections:    " << stats.num_intersects << "\n";
        std::cout << "  Max per tile:     " << stats.max_splats_per_tile << "\n";
        std::cout << "  Tiles per splat:  " << stats.mean_tiles_per_splat << "\n";
        std::cout << "  Projection:       " << projection_ms << " ms\n";
        std::cout << "  Binning:          " << binning_ms << " ms\n";
        std::cout << "\n";

        if (!output_path.empty() && !stats.save_json(output_path)) {
            return 1;
        }
    } catch (const std::exception& e) {
        spdlog::error("Tile binning failed: {}", e.what());
        return 1;
    }

    return 0;
}
