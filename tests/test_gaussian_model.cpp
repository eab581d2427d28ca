#include "core/gaussian.hpp"
#include "utils/ply_io.hpp"

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <cmath>
#include <filesystem>
#include <limits>
#include <vector>

namespace gstile {
namespace {

/// Helper: create a small GaussianModel with random raw parameters.
GaussianModel make_test_model(int64_t n) {
    GaussianModel m;
    m.positions  = torch::randn({n, 3}, torch::kFloat32);
    m.colors     = torch::rand({n, 3}, torch::kFloat32);
    m.opacities  = torch::randn({n, 1}, torch::kFloat32);
    m.rotations  = torch::randn({n, 4}, torch::kFloat32);
    m.scales     = torch::randn({n, 3}, torch::kFloat32);
    return m;
}

// ---------------------------------------------------------------------------
// Basic construction & validation
// ---------------------------------------------------------------------------

TEST(GaussianModel, DefaultIsInvalid) {
    GaussianModel m;
    EXPECT_FALSE(m.is_valid());
    EXPECT_EQ(m.num_gaussians(), 0);
}

TEST(GaussianModel, ValidAfterCreation) {
    auto m = make_test_model(100);
    EXPECT_TRUE(m.is_valid());
    EXPECT_EQ(m.num_gaussians(), 100);
}

TEST(GaussianModel, InvalidShapesDetected) {
    auto m = make_test_model(10);
    // Break position shape
    auto saved = m.positions;
    m.positions = torch::randn({10, 4});
    EXPECT_FALSE(m.is_valid());
    m.positions = saved;

    // Colors must be RGB
    saved = m.colors;
    m.colors = torch::rand({10, 4});
    EXPECT_FALSE(m.is_valid());
    m.colors = saved;

    // Break count mismatch
    m.opacities = torch::randn({5, 1});
    EXPECT_FALSE(m.is_valid());
}

TEST(GaussianModel, EmptyModelIsValid) {
    GaussianModel m;
    m.positions  = torch::zeros({0, 3}, torch::kFloat32);
    m.colors     = torch::zeros({0, 3}, torch::kFloat32);
    m.opacities  = torch::zeros({0, 1}, torch::kFloat32);
    m.rotations  = torch::zeros({0, 4}, torch::kFloat32);
    m.scales     = torch::zeros({0, 3}, torch::kFloat32);
    EXPECT_TRUE(m.is_valid());
    EXPECT_EQ(m.num_gaussians(), 0);
}

// ---------------------------------------------------------------------------
// Activation
// ---------------------------------------------------------------------------

TEST(ActivateGaussian, AppliesExpSigmoidAndNormalize) {
    const float pos[3] = {1.0f, -2.0f, 3.0f};
    const float log_scale[3] = {0.0f, std::log(2.0f), std::log(0.5f)};
    const float rot[4] = {2.0f, 0.0f, 0.0f, 0.0f};
    const float color[3] = {0.1f, 0.2f, 0.3f};

    const Gaussian3D g = activate_gaussian(pos, log_scale, rot, 0.0f, color);

    EXPECT_TRUE(g.position.isApprox(Eigen::Vector3f(1.0f, -2.0f, 3.0f)));
    EXPECT_TRUE(g.scale.isApprox(Eigen::Vector3f(1.0f, 2.0f, 0.5f), 1e-6f));
    EXPECT_TRUE(g.rotation.isApprox(Eigen::Vector4f(1.0f, 0.0f, 0.0f, 0.0f)));
    EXPECT_FLOAT_EQ(g.opacity, 0.5f);
    EXPECT_TRUE(g.color.isApprox(Eigen::Vector3f(0.1f, 0.2f, 0.3f)));
    EXPECT_TRUE(g.is_well_formed());
}

TEST(ActivateGaussian, ScaleModifierMultipliesActivatedScale) {
    const float pos[3] = {0.0f, 0.0f, 0.0f};
    const float log_scale[3] = {std::log(0.1f), std::log(0.2f), std::log(0.3f)};
    const float rot[4] = {1.0f, 0.0f, 0.0f, 0.0f};
    const float color[3] = {0.0f, 0.0f, 0.0f};

    const Gaussian3D g = activate_gaussian(pos, log_scale, rot, 0.0f, color, 3.0f);
    EXPECT_TRUE(g.scale.isApprox(Eigen::Vector3f(0.3f, 0.6f, 0.9f), 1e-5f));
}

TEST(ActivateGaussian, ZeroQuaternionStaysFinite) {
    const float pos[3] = {0.0f, 0.0f, 0.0f};
    const float log_scale[3] = {0.0f, 0.0f, 0.0f};
    const float rot[4] = {0.0f, 0.0f, 0.0f, 0.0f};
    const float color[3] = {0.0f, 0.0f, 0.0f};

    const Gaussian3D g = activate_gaussian(pos, log_scale, rot, 0.0f, color);
    EXPECT_TRUE(g.rotation.allFinite());
    // Not a unit quaternion, so the projection preconditions do not hold.
    EXPECT_FALSE(g.is_well_formed());
}

TEST(Gaussian3D, WellFormedChecks) {
    Gaussian3D g;
    EXPECT_TRUE(g.is_well_formed());

    Gaussian3D bad_scale = g;
    bad_scale.scale.y() = 0.0f;
    EXPECT_FALSE(bad_scale.is_well_formed());

    Gaussian3D bad_opacity = g;
    bad_opacity.opacity = 0.0f;
    EXPECT_FALSE(bad_opacity.is_well_formed());
    bad_opacity.opacity = 1.5f;
    EXPECT_FALSE(bad_opacity.is_well_formed());

    Gaussian3D bad_quat = g;
    bad_quat.rotation = Eigen::Vector4f(1.0f, 0.1f, 0.0f, 0.0f);
    EXPECT_FALSE(bad_quat.is_well_formed());

    Gaussian3D nan_pos = g;
    nan_pos.position.x() = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(nan_pos.is_well_formed());
}

TEST(GaussianModel, FromGaussiansRejectsIllFormed) {
    std::vector<Gaussian3D> gaussians(2);
    gaussians[1].scale = Eigen::Vector3f(0.1f, 0.0f, 0.1f);
    EXPECT_THROW(GaussianModel::from_gaussians(gaussians), c10::Error);

    gaussians[1].scale = Eigen::Vector3f::Constant(0.1f);
    gaussians[1].opacity = 0.0f;
    EXPECT_THROW(GaussianModel::from_gaussians(gaussians), c10::Error);

    gaussians[1].opacity = 0.5f;
    EXPECT_NO_THROW(GaussianModel::from_gaussians(gaussians));
}

TEST(GaussianModel, FromGaussiansInvertsActivation) {
    std::vector<Gaussian3D> gaussians(2);
    gaussians[0].position = Eigen::Vector3f(1.0f, 2.0f, 3.0f);
    gaussians[0].scale = Eigen::Vector3f(0.1f, 0.2f, 0.3f);
    gaussians[0].opacity = 0.25f;
    gaussians[0].color = Eigen::Vector3f(0.7f, 0.8f, 0.9f);
    gaussians[1].rotation = Eigen::Vector4f(0.0f, 0.0f, 1.0f, 0.0f);
    gaussians[1].opacity = 1.0f;

    const auto model = GaussianModel::from_gaussians(gaussians);
    ASSERT_TRUE(model.is_valid());
    ASSERT_EQ(model.num_gaussians(), 2);

    auto pos = model.positions.accessor<float, 2>();
    auto col = model.colors.accessor<float, 2>();
    auto opa = model.opacities.accessor<float, 2>();
    auto rot = model.rotations.accessor<float, 2>();
    auto scl = model.scales.accessor<float, 2>();

    for (int64_t i = 0; i < 2; ++i) {
        const Gaussian3D g = activate_gaussian(&pos[i][0], &scl[i][0], &rot[i][0],
                                               opa[i][0], &col[i][0]);
        const Gaussian3D& src = gaussians[static_cast<size_t>(i)];
        EXPECT_TRUE(g.position.isApprox(src.position, 1e-6f));
        EXPECT_TRUE(g.scale.isApprox(src.scale, 1e-5f));
        EXPECT_TRUE(g.rotation.isApprox(src.rotation, 1e-6f));
        EXPECT_NEAR(g.opacity, src.opacity, 1e-5f);
        EXPECT_TRUE(g.color.isApprox(src.color, 1e-6f));
    }

    // Opacity 1 is stored as a finite logit.
    EXPECT_TRUE(std::isfinite(opa[1][0]));
}

// ---------------------------------------------------------------------------
// PLY roundtrip
// ---------------------------------------------------------------------------

class GaussianPlyTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "gstile_test_gaussian_ply";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }
};

TEST_F(GaussianPlyTest, Roundtrip) {
    auto original = make_test_model(50);
    auto ply_path = temp_dir_ / "model.ply";

    ASSERT_TRUE(original.save_ply(ply_path));
    ASSERT_TRUE(std::filesystem::exists(ply_path));

    auto loaded = GaussianModel::load_ply(ply_path);
    ASSERT_TRUE(loaded.is_valid());
    EXPECT_EQ(loaded.num_gaussians(), 50);

    // Values should match within float precision
    EXPECT_TRUE(torch::allclose(original.positions, loaded.positions, 1e-5, 1e-5));
    EXPECT_TRUE(torch::allclose(original.colors, loaded.colors, 1e-5, 1e-5));
    EXPECT_TRUE(torch::allclose(original.opacities, loaded.opacities, 1e-5, 1e-5));
    EXPECT_TRUE(torch::allclose(original.rotations, loaded.rotations, 1e-5, 1e-5));
    EXPECT_TRUE(torch::allclose(original.scales, loaded.scales, 1e-5, 1e-5));
}

TEST_F(GaussianPlyTest, EmptyModel) {
    GaussianModel m;
    m.positions  = torch::zeros({0, 3}, torch::kFloat32);
    m.colors     = torch::zeros({0, 3}, torch::kFloat32);
    m.opacities  = torch::zeros({0, 1}, torch::kFloat32);
    m.rotations  = torch::zeros({0, 4}, torch::kFloat32);
    m.scales     = torch::zeros({0, 3}, torch::kFloat32);

    auto ply_path = temp_dir_ / "empty.ply";
    ASSERT_TRUE(m.save_ply(ply_path));

    auto loaded = GaussianModel::load_ply(ply_path);
    EXPECT_EQ(loaded.num_gaussians(), 0);
}

TEST_F(GaussianPlyTest, InvalidModelNotWritten) {
    GaussianModel m;
    EXPECT_FALSE(m.save_ply(temp_dir_ / "invalid.ply"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / "invalid.ply"));
}

} // anonymous namespace
} // namespace gstile
