#pragma once

/// @file frame_state.hpp
/// @brief Per-frame camera/image configuration and the shared visible-splat
///        counter.
///
/// FrameUniforms is read-only for the whole frame. VisibleCounter is the only
/// shared mutable state: projection workers may only increment it (through a
/// Claimer), and the final count may only be read after seal(), which the
/// caller issues once every worker of the frame has joined.

#include "core/types.hpp"

#include <Eigen/Core>

#include <atomic>
#include <cstdint>

namespace gstile {

/// @brief Settings controlling the projection stage.
struct RenderSettings {
    float background[3] = {0.0f, 0.0f, 0.0f}; ///< Background color (RGB, 0-1)
    int active_sh_degree = 0;                    ///< SH degree of the external color stage
    float scale_modifier = 1.0f;                 ///< Global scale multiplier for Gaussians
    float near_clip = kNearClip;                 ///< Minimum view-space depth
    bool validate_inputs = true;                 ///< Reject non-finite parameters up front
};

/// @brief Read-only frame configuration shared by every projection worker.
struct FrameUniforms {
    Eigen::Matrix4f view_matrix = Eigen::Matrix4f::Identity(); ///< World-to-camera
    Eigen::Vector2f focal = Eigen::Vector2f::Zero();           ///< (fx, fy) in pixels
    Eigen::Vector2f pixel_center = Eigen::Vector2f::Zero();    ///< Principal point (cx, cy)
    Eigen::Vector2i img_size = Eigen::Vector2i::Zero();        ///< (width, height) in pixels
    Eigen::Vector2i tile_bounds = Eigen::Vector2i::Zero();     ///< Tiles across (x, y)
    Eigen::Vector3f background = Eigen::Vector3f::Zero();
    int sh_degree = 0;
    int64_t total_splats = 0;
    float near_clip = kNearClip;

    int num_tiles() const { return tile_bounds.x() * tile_bounds.y(); }
};

/// @brief Build the frame uniforms for a camera.
///
/// Tile bounds are derived from the image size with ceil_div(size, kTileSize).
FrameUniforms make_frame_uniforms(const CameraInfo& camera,
                                  const RenderSettings& settings,
                                  int64_t total_splats);

/// @brief Atomic count of visible splats for one frame.
///
/// During projection, workers call Claimer::claim() exactly once per visible
/// splat to obtain a unique output slot. After the parallel phase has joined,
/// the owner calls seal(); only then is value() legal. Claiming after seal()
/// or reading before it throws std::logic_error.
class VisibleCounter {
public:
    /// @brief Increment-only view handed to projection workers.
    class Claimer {
    public:
        /// @brief Claim the next output slot. Safe to call concurrently.
        uint32_t claim() {
            return count_->fetch_add(1, std::memory_order_relaxed);
        }

    private:
        friend class VisibleCounter;
        explicit Claimer(std::atomic<uint32_t>* count) : count_(count) {}

        std::atomic<uint32_t>* count_;
    };

    VisibleCounter() = default;
    VisibleCounter(const VisibleCounter&) = delete;
    VisibleCounter& operator=(const VisibleCounter&) = delete;

    /// @brief Get the increment-only view. Throws if the counter is sealed.
    Claimer claimer();

    /// @brief End the increment phase and return the final count.
    ///
    /// Must be called after all workers holding a Claimer have finished.
    uint32_t seal();

    /// @brief Final count for the frame. Throws if not sealed.
    uint32_t value() const;

    bool sealed() const { return sealed_; }

    /// @brief Slots claimed so far. Only exact when no worker is claiming.
    uint32_t claimed() const { return count_.load(std::memory_order_relaxed); }

    /// @brief Zero the count and reopen it for the next frame.
    void reset();

private:
    std::atomic<uint32_t> count_{0};
    bool sealed_ = false;
};

} // namespace gstile
