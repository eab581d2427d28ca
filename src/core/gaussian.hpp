#pragma once

#include <torch/torch.h>

#include <Eigen/Core>

#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace gstile {

/// @brief One activated 3D Gaussian, as consumed by the projection math.
///
/// Scale is positive, opacity in (0, 1], rotation a unit quaternion stored
/// scalar-first (w, x, y, z). Color is not interpreted by this library.
struct Gaussian3D {
    Eigen::Vector3f position = Eigen::Vector3f::Zero();
    Eigen::Vector3f scale = Eigen::Vector3f::Ones();
    Eigen::Vector4f rotation = Eigen::Vector4f(1.0f, 0.0f, 0.0f, 0.0f);
    float opacity = 1.0f;
    Eigen::Vector3f color = Eigen::Vector3f::Zero();

    /// @brief Check the assumptions the projection math relies on: finite
    ///        values, positive scale, opacity in (0, 1] and a unit quaternion.
    bool is_well_formed() const;
};

/// @brief Build an activated Gaussian from raw model parameters.
///
/// @param position      World-space mean (3 floats).
/// @param log_scale     Log-space scale (3 floats); exp() is applied.
/// @param raw_rotation  Unnormalised quaternion (w, x, y, z).
/// @param logit_opacity Logit-space opacity; sigmoid() is applied.
/// @param color         RGB passed through as-is (3 floats).
/// @param scale_modifier Global multiplier applied after exp().
Gaussian3D activate_gaussian(const float* position,
                             const float* log_scale,
                             const float* raw_rotation,
                             float logit_opacity,
                             const float* color,
                             float scale_modifier = 1.0f);

/// @brief Structure-of-Arrays storage for 3D Gaussian parameters.
///
/// Parameters live in their activation-function-friendly spaces:
///   - scales:    log-space (apply exp() to get actual scale)
///   - opacities: logit-space (apply sigmoid() to get [0,1] opacity)
///   - rotations: raw quaternions (normalize before use)
///
/// Colors are already-evaluated RGB supplied by an external color stage.
///
/// Tensor shapes (N = number of Gaussians):
///   - positions:  [N, 3]
///   - colors:     [N, 3]
///   - opacities:  [N, 1]
///   - rotations:  [N, 4]  (wxyz, scalar-first)
///   - scales:     [N, 3]
struct GaussianModel {
    torch::Tensor positions;   // [N, 3]  world-space means
    torch::Tensor colors;      // [N, 3]  RGB, opaque to the projection
    torch::Tensor opacities;   // [N, 1]  logit-space opacity
    torch::Tensor rotations;   // [N, 4]  quaternions (w, x, y, z)
    torch::Tensor scales;      // [N, 3]  log-space scale

    /// @brief Number of Gaussians in the model.
    int64_t num_gaussians() const {
        return positions.defined() ? positions.size(0) : 0;
    }

    /// @brief Check that all tensors are on the same device and have
    ///        consistent leading dimension.
    bool is_valid() const;

    /// @brief Build a CPU model from activated Gaussians (inverse of
    ///        activate_gaussian() with scale_modifier = 1).
    ///
    /// Throws c10::Error if any Gaussian fails is_well_formed().
    static GaussianModel from_gaussians(std::span<const Gaussian3D> gaussians);

    /// @brief Save the Gaussian model to a 3DGS-layout PLY file.
    /// @return true on success.
    bool save_ply(const std::filesystem::path& path) const;

    /// @brief Load a Gaussian model from a PLY file (on CPU).
    static GaussianModel load_ply(const std::filesystem::path& path);
};

} // namespace gstile
