#pragma once

#include <Eigen/Core>

#include <cstdint>
#include <string>
#include <type_traits>

namespace gstile {

// ---------------------------------------------------------------------------
// Fixed constants of the tile pipeline
// ---------------------------------------------------------------------------

/// @brief Tile side length in pixels. Each tile is kTileSize × kTileSize pixels.
constexpr int kTileSize = 16;

/// @brief Pixels per tile.
constexpr int kTileArea = kTileSize * kTileSize;

/// @brief Number of Gaussians handed to one worker task at a time.
///        Scheduling grain only; the math does not depend on it.
constexpr int kBatchSize = 256;

/// @brief Blur added to the 2D covariance diagonal (anti-aliasing and
///        conditioning of the conic inversion).
constexpr float kCovBlur = 0.3f;

/// @brief Alpha below which a splat is considered invisible.
constexpr float kVisibilityThreshold = 1.0f / 255.0f;

/// @brief Splats closer to the camera than this view-space depth are culled.
constexpr float kNearClip = 0.01f;

// ---------------------------------------------------------------------------
// Camera
// ---------------------------------------------------------------------------

struct CameraIntrinsics {
    float fx = 0.0f;
    float fy = 0.0f;
    float cx = 0.0f;
    float cy = 0.0f;
};

struct CameraInfo {
    int width = 0;
    int height = 0;
    CameraIntrinsics intrinsics;

    /// World-to-camera rotation.
    Eigen::Matrix3f rotation = Eigen::Matrix3f::Identity();

    /// World-to-camera translation.
    Eigen::Vector3f translation = Eigen::Vector3f::Zero();

    /// Optional label (e.g. image name) for logging.
    std::string name;

    /// Full 4x4 world-to-camera transform.
    Eigen::Matrix4f world_to_camera() const {
        Eigen::Matrix4f m = Eigen::Matrix4f::Identity();
        m.block<3, 3>(0, 0) = rotation;
        m.block<3, 1>(0, 3) = translation;
        return m;
    }
};

// ---------------------------------------------------------------------------
// Packed records
// ---------------------------------------------------------------------------

/// @brief Three floats with no padding, for dense buffers.
///
/// Eigen::Vector3f is used for arithmetic; convert with to_packed() /
/// from_packed() in core/linalg.hpp.
struct PackedVec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
};

static_assert(sizeof(PackedVec3) == 3 * sizeof(float), "PackedVec3 must not be padded");
static_assert(std::is_standard_layout_v<PackedVec3>);

/// @brief Per-splat output record of the projection stage.
///
/// One record per visible Gaussian, stored in claim order. The conic holds
/// the independent entries (xx, xy, yy) of the inverse 2D covariance. Color
/// is premultiplied by alpha; alpha is the compensated opacity.
struct ProjectedSplat {
    float xy[2] = {0.0f, 0.0f};
    PackedVec3 conic;
    float color[4] = {0.0f, 0.0f, 0.0f, 0.0f};
};

static_assert(sizeof(ProjectedSplat) == 9 * sizeof(float), "ProjectedSplat must not be padded");
static_assert(std::is_standard_layout_v<ProjectedSplat>);

/// @brief Integer box in tile (or pixel) units. min inclusive, max exclusive.
struct TileBoundingBox {
    int min_x = 0;
    int min_y = 0;
    int max_x = 0;
    int max_y = 0;

    int width() const { return max_x - min_x; }
    int height() const { return max_y - min_y; }
    int area() const { return width() * height(); }
    bool empty() const { return width() <= 0 || height() <= 0; }

    bool contains(int x, int y) const {
        return x >= min_x && x < max_x && y >= min_y && y < max_y;
    }

    bool operator==(const TileBoundingBox&) const = default;
};

} // namespace gstile
