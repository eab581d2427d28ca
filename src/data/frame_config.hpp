#pragma once

/// @file frame_config.hpp
/// @brief JSON description of a frame: camera plus projection settings.
///
/// Example:
/// @code{.json}
/// {
///   "camera": {
///     "width": 640, "height": 480,
///     "fx": 500.0, "fy": 500.0, "cx": 320.0, "cy": 240.0,
///     "quaternion": [1, 0, 0, 0],
///     "translation": [0, 0, 0]
///   },
///   "render": { "background": [0, 0, 0], "scale_modifier": 1.0 }
/// }
/// @endcode
///
/// "rotation" (3x3, row-major nested arrays) may be given instead of
/// "quaternion" (w, x, y, z). fy defaults to fx; cx, cy default to the image
/// center. The "render" block and each of its keys are optional.

#include "core/frame_state.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>

namespace gstile {

struct FrameConfig {
    CameraInfo camera;
    RenderSettings render;
};

/// @brief Parse a frame config from JSON text.
/// @throws std::runtime_error on malformed JSON or missing / invalid keys.
FrameConfig parse_frame_config(const std::string& json_text);

/// @brief Load a frame config from a JSON file.
/// @throws std::runtime_error if the file cannot be read or parsed.
FrameConfig load_frame_config(const std::filesystem::path& path);

} // namespace gstile
