#include "data/frame_config.hpp"
#include "core/linalg.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace gstile {

namespace {

using nlohmann::json;

Eigen::Matrix3f parse_rotation(const json& cam) {
    if (cam.contains("rotation")) {
        const json& r = cam.at("rotation");
        if (!r.is_array() || r.size() != 3)
            throw std::runtime_error("camera.rotation must be a 3x3 array");
        Eigen::Matrix3f m;
        for (int row = 0; row < 3; ++row) {
            const json& rj = r.at(row);
            if (!rj.is_array() || rj.size() != 3)
                throw std::runtime_error("camera.rotation must be a 3x3 array");
            for (int col = 0; col < 3; ++col) {
                m(row, col) = rj.at(col).get<float>();
            }
        }
        return m;
    }

    if (cam.contains("quaternion")) {
        const auto q = cam.at("quaternion").get<std::vector<float>>();
        if (q.size() != 4)
            throw std::runtime_error("camera.quaternion must have 4 entries (w, x, y, z)");
        Eigen::Vector4f qv(q[0], q[1], q[2], q[3]);
        const float norm = qv.norm();
        if (!(norm > 0.0f))
            throw std::runtime_error("camera.quaternion must be non-zero");
        return quat_to_rotmat(qv / norm);
    }

    return Eigen::Matrix3f::Identity();
}

CameraInfo parse_camera(const json& cam) {
    CameraInfo info;
    info.width = cam.at("width").get<int>();
    info.height = cam.at("height").get<int>();
    if (info.width <= 0 || info.height <= 0)
        throw std::runtime_error("camera.width and camera.height must be positive");

    info.intrinsics.fx = cam.at("fx").get<float>();
    info.intrinsics.fy = cam.value("fy", info.intrinsics.fx);
    info.intrinsics.cx = cam.value("cx", 0.5f * static_cast<float>(info.width));
    info.intrinsics.cy = cam.value("cy", 0.5f * static_cast<float>(info.height));
    if (!(info.intrinsics.fx > 0.0f) || !(info.intrinsics.fy > 0.0f))
        throw std::runtime_error("camera.fx and camera.fy must be positive");

    info.rotation = parse_rotation(cam);

    if (cam.contains("translation")) {
        const auto t = cam.at("translation").get<std::vector<float>>();
        if (t.size() != 3)
            throw std::runtime_error("camera.translation must have 3 entries");
        info.translation = Eigen::Vector3f(t[0], t[1], t[2]);
    }

    info.name = cam.value("name", std::string{});
    return info;
}

RenderSettings parse_render(const json& render) {
    RenderSettings s;
    if (render.contains("background")) {
        const auto bg = render.at("background").get<std::vector<float>>();
        if (bg.size() != 3)
            throw std::runtime_error("render.background must have 3 entries");
        s.background[0] = bg[0];
        s.background[1] = bg[1];
        s.background[2] = bg[2];
    }
    s.active_sh_degree = render.value("sh_degree", s.active_sh_degree);
    s.scale_modifier = render.value("scale_modifier", s.scale_modifier);
    s.near_clip = render.value("near_clip", s.near_clip);
    s.validate_inputs = render.value("validate_inputs", s.validate_inputs);

    if (s.active_sh_degree < 0)
        throw std::runtime_error("render.sh_degree must be non-negative");
    if (!(s.scale_modifier > 0.0f))
        throw std::runtime_error("render.scale_modifier must be positive");
    return s;
}

} // namespace

FrameConfig parse_frame_config(const std::string& json_text) {
    try {
        const json j = json::parse(json_text);
        if (!j.contains("camera"))
            throw std::runtime_error("missing 'camera' block");

        FrameConfig config;
        config.camera = parse_camera(j.at("camera"));
        if (j.contains("render")) {
            config.render = parse_render(j.at("render"));
        }
        return config;
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid frame config: ") + e.what());
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string("Invalid frame config: ") + e.what());
    }
}

FrameConfig load_frame_config(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Failed to open frame config: " + path.string());

    std::stringstream ss;
    ss << ifs.rdbuf();

    FrameConfig config = parse_frame_config(ss.str());
    spdlog::info("Loaded frame config {}: {}x{}, f=({:.1f}, {:.1f})",
                 path.string(), config.camera.width, config.camera.height,
                 config.camera.intrinsics.fx, config.camera.intrinsics.fy);
    return config;
}

} // namespace gstile
