#include "core/gaussian.hpp"
#include "utils/ply_io.hpp"

#include <algorithm>
#include <cmath>

namespace gstile {

namespace {

constexpr float kQuatNormTolerance = 1e-3f;

// Opacities are clamped away from {0, 1} before taking the logit so the
// stored value stays finite.
constexpr float kOpacityEps = 1e-6f;

float sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

float logit(float p) {
    p = std::clamp(p, kOpacityEps, 1.0f - kOpacityEps);
    return std::log(p / (1.0f - p));
}

} // namespace

bool Gaussian3D::is_well_formed() const {
    if (!position.allFinite() || !scale.allFinite() || !rotation.allFinite() ||
        !color.allFinite() || !std::isfinite(opacity)) {
        return false;
    }
    if ((scale.array() <= 0.0f).any()) return false;
    if (!(opacity > 0.0f && opacity <= 1.0f)) return false;
    return std::abs(rotation.norm() - 1.0f) <= kQuatNormTolerance;
}

Gaussian3D activate_gaussian(const float* position,
                             const float* log_scale,
                             const float* raw_rotation,
                             float logit_opacity,
                             const float* color,
                             float scale_modifier) {
    Gaussian3D g;
    g.position = Eigen::Vector3f(position[0], position[1], position[2]);
    g.scale = Eigen::Vector3f(std::exp(log_scale[0]),
                              std::exp(log_scale[1]),
                              std::exp(log_scale[2])) * scale_modifier;

    Eigen::Vector4f q(raw_rotation[0], raw_rotation[1], raw_rotation[2], raw_rotation[3]);
    g.rotation = q / std::max(q.norm(), 1e-8f);

    g.opacity = sigmoid(logit_opacity);
    g.color = Eigen::Vector3f(color[0], color[1], color[2]);
    return g;
}

bool GaussianModel::is_valid() const {
    if (!positions.defined()) return false;
    const int64_t n = positions.size(0);
    if (positions.dim() != 2 || positions.size(1) != 3) return false;
    if (!colors.defined() || colors.dim() != 2 ||
        colors.size(0) != n || colors.size(1) != 3) return false;
    if (!opacities.defined() || opacities.dim() != 2 ||
        opacities.size(0) != n || opacities.size(1) != 1) return false;
    if (!rotations.defined() || rotations.dim() != 2 ||
        rotations.size(0) != n || rotations.size(1) != 4) return false;
    if (!scales.defined() || scales.dim() != 2 ||
        scales.size(0) != n || scales.size(1) != 3) return false;

    // All on same device
    auto dev = positions.device();
    if (colors.device() != dev || opacities.device() != dev ||
        rotations.device() != dev || scales.device() != dev) return false;

    return true;
}

GaussianModel GaussianModel::from_gaussians(std::span<const Gaussian3D> gaussians) {
    const auto n = static_cast<int64_t>(gaussians.size());

    GaussianModel model;
    model.positions = torch::zeros({n, 3}, torch::kFloat32);
    model.colors    = torch::zeros({n, 3}, torch::kFloat32);
    model.opacities = torch::zeros({n, 1}, torch::kFloat32);
    model.rotations = torch::zeros({n, 4}, torch::kFloat32);
    model.scales    = torch::zeros({n, 3}, torch::kFloat32);

    auto pos_acc = model.positions.accessor<float, 2>();
    auto col_acc = model.colors.accessor<float, 2>();
    auto opa_acc = model.opacities.accessor<float, 2>();
    auto rot_acc = model.rotations.accessor<float, 2>();
    auto scl_acc = model.scales.accessor<float, 2>();

    for (int64_t i = 0; i < n; ++i) {
        const Gaussian3D& g = gaussians[static_cast<size_t>(i)];
        TORCH_CHECK(g.is_well_formed(), "Gaussian ", i,
                    " is ill-formed (non-finite, non-positive scale, opacity outside"
                    " (0, 1] or non-unit rotation)");
        for (int k = 0; k < 3; ++k) {
            pos_acc[i][k] = g.position[k];
            col_acc[i][k] = g.color[k];
            scl_acc[i][k] = std::log(g.scale[k]);
        }
        for (int k = 0; k < 4; ++k) {
            rot_acc[i][k] = g.rotation[k];
        }
        opa_acc[i][0] = logit(g.opacity);
    }

    return model;
}

bool GaussianModel::save_ply(const std::filesystem::path& path) const {
    return write_gaussian_ply(path, *this);
}

GaussianModel GaussianModel::load_ply(const std::filesystem::path& path) {
    return read_gaussian_ply(path);
}

} // namespace gstile
