#include "data/frame_config.hpp"

#include <Eigen/LU>
#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

namespace gstile {
namespace {

// ---------------------------------------------------------------------------
// parse_frame_config
// ---------------------------------------------------------------------------

TEST(FrameConfig, MinimalCameraUsesDefaults) {
    const auto config = parse_frame_config(R"({
        "camera": { "width": 640, "height": 480, "fx": 500.0 }
    })");

    EXPECT_EQ(config.camera.width, 640);
    EXPECT_EQ(config.camera.height, 480);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.fx, 500.0f);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.fy, 500.0f);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.cx, 320.0f);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.cy, 240.0f);
    EXPECT_TRUE(config.camera.rotation.isIdentity());
    EXPECT_TRUE(config.camera.translation.isZero());

    const RenderSettings defaults;
    EXPECT_FLOAT_EQ(config.render.scale_modifier, defaults.scale_modifier);
    EXPECT_FLOAT_EQ(config.render.near_clip, kNearClip);
    EXPECT_TRUE(config.render.validate_inputs);
}

TEST(FrameConfig, FullConfig) {
    const auto config = parse_frame_config(R"({
        "camera": {
            "name": "frame_0007",
            "width": 800, "height": 600,
            "fx": 700.0, "fy": 650.0, "cx": 401.5, "cy": 299.5,
            "rotation": [[0, -1, 0], [1, 0, 0], [0, 0, 1]],
            "translation": [0.5, -1.0, 2.0]
        },
        "render": {
            "background": [1.0, 0.5, 0.25],
            "sh_degree": 3,
            "scale_modifier": 0.5,
            "near_clip": 0.2,
            "validate_inputs": false
        }
    })");

    EXPECT_EQ(config.camera.name, "frame_0007");
    EXPECT_FLOAT_EQ(config.camera.intrinsics.fy, 650.0f);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.cx, 401.5f);
    EXPECT_FLOAT_EQ(config.camera.rotation(0, 1), -1.0f);
    EXPECT_FLOAT_EQ(config.camera.rotation(1, 0), 1.0f);
    EXPECT_TRUE(config.camera.translation.isApprox(Eigen::Vector3f(0.5f, -1.0f, 2.0f)));

    EXPECT_FLOAT_EQ(config.render.background[0], 1.0f);
    EXPECT_FLOAT_EQ(config.render.background[2], 0.25f);
    EXPECT_EQ(config.render.active_sh_degree, 3);
    EXPECT_FLOAT_EQ(config.render.scale_modifier, 0.5f);
    EXPECT_FLOAT_EQ(config.render.near_clip, 0.2f);
    EXPECT_FALSE(config.render.validate_inputs);
}

TEST(FrameConfig, QuaternionIsNormalized) {
    // 90 degrees about z, given at twice unit length
    const float h = 2.0f * std::sqrt(0.5f);
    const auto config = parse_frame_config(
        R"({"camera": {"width": 64, "height": 64, "fx": 50, "quaternion": [)" +
        std::to_string(h) + ", 0, 0, " + std::to_string(h) + "]}}");

    const Eigen::Vector3f x_rot = config.camera.rotation * Eigen::Vector3f::UnitX();
    EXPECT_NEAR(x_rot.x(), 0.0f, 1e-5f);
    EXPECT_NEAR(x_rot.y(), 1.0f, 1e-5f);
    EXPECT_NEAR(config.camera.rotation.determinant(), 1.0f, 1e-5f);
}

TEST(FrameConfig, MalformedInputThrows) {
    // Not JSON
    EXPECT_THROW(parse_frame_config("{ camera: "), std::runtime_error);
    // No camera block
    EXPECT_THROW(parse_frame_config(R"({"render": {}})"), std::runtime_error);
    // Missing focal length
    EXPECT_THROW(parse_frame_config(R"({"camera": {"width": 4, "height": 4}})"),
                 std::runtime_error);
    // Non-positive size
    EXPECT_THROW(parse_frame_config(R"({"camera": {"width": 0, "height": 4, "fx": 1}})"),
                 std::runtime_error);
    // Wrong type
    EXPECT_THROW(parse_frame_config(R"({"camera": {"width": "wide", "height": 4, "fx": 1}})"),
                 std::runtime_error);
    // Bad rotation shape
    EXPECT_THROW(parse_frame_config(
                     R"({"camera": {"width": 4, "height": 4, "fx": 1, "rotation": [[1, 0], [0, 1]]}})"),
                 std::runtime_error);
    // Zero quaternion
    EXPECT_THROW(parse_frame_config(
                     R"({"camera": {"width": 4, "height": 4, "fx": 1, "quaternion": [0, 0, 0, 0]}})"),
                 std::runtime_error);
    // Non-positive scale modifier
    EXPECT_THROW(parse_frame_config(
                     R"({"camera": {"width": 4, "height": 4, "fx": 1}, "render": {"scale_modifier": 0}})"),
                 std::runtime_error);
}

TEST(FrameConfig, ErrorMessageNamesTheConfig) {
    try {
        parse_frame_config(R"({"render": {}})");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Invalid frame config"), std::string::npos);
    }
}

// ---------------------------------------------------------------------------
// load_frame_config
// ---------------------------------------------------------------------------

TEST(FrameConfig, LoadFromFile) {
    const auto dir = std::filesystem::temp_directory_path() / "gstile_frame_config_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "frame.json";
    {
        std::ofstream ofs(path);
        ofs << R"({"camera": {"width": 320, "height": 240, "fx": 250}})";
    }

    const auto config = load_frame_config(path);
    EXPECT_EQ(config.camera.width, 320);
    EXPECT_FLOAT_EQ(config.camera.intrinsics.cy, 120.0f);

    std::filesystem::remove_all(dir);
}

TEST(FrameConfig, LoadMissingFileThrows) {
    EXPECT_THROW(load_frame_config("/nonexistent_dir_gstile/frame.json"), std::runtime_error);
}

} // namespace
} // namespace gstile
