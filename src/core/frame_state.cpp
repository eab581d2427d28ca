#include "core/frame_state.hpp"
#include "core/linalg.hpp"

#include <stdexcept>

namespace gstile {

FrameUniforms make_frame_uniforms(const CameraInfo& camera,
                                  const RenderSettings& settings,
                                  int64_t total_splats) {
    FrameUniforms u;
    u.view_matrix = camera.world_to_camera();
    u.focal = Eigen::Vector2f(camera.intrinsics.fx, camera.intrinsics.fy);
    u.pixel_center = Eigen::Vector2f(camera.intrinsics.cx, camera.intrinsics.cy);
    u.img_size = Eigen::Vector2i(camera.width, camera.height);
    u.tile_bounds = tile_bounds_for(u.img_size);
    u.background = Eigen::Vector3f(settings.background[0],
                                   settings.background[1],
                                   settings.background[2]);
    u.sh_degree = settings.active_sh_degree;
    u.total_splats = total_splats;
    u.near_clip = settings.near_clip;
    return u;
}

VisibleCounter::Claimer VisibleCounter::claimer() {
    if (sealed_) {
        throw std::logic_error("VisibleCounter: cannot claim slots after seal()");
    }
    return Claimer(&count_);
}

uint32_t VisibleCounter::seal() {
    sealed_ = true;
    return count_.load(std::memory_order_acquire);
}

uint32_t VisibleCounter::value() const {
    if (!sealed_) {
        throw std::logic_error("VisibleCounter: value() read before seal()");
    }
    return count_.load(std::memory_order_acquire);
}

void VisibleCounter::reset() {
    count_.store(0, std::memory_order_relaxed);
    sealed_ = false;
}

} // namespace gstile
