#pragma once

#include <filesystem>

// Forward declaration; the full type lives in core/gaussian.hpp
namespace gstile { struct GaussianModel; }

namespace gstile {

/// @brief Write a GaussianModel to a binary PLY file.
///
/// Uses the common 3D Gaussian Splatting layout so other tools can open it:
///   - x, y, z (position)
///   - nx, ny, nz (normals, written as zero)
///   - f_dc_0..f_dc_2 (DC SH band, derived from the stored RGB)
///   - opacity (logit-space)
///   - scale_0..scale_2 (log-space)
///   - rot_0..rot_3 (quaternion wxyz)
///
/// @param path Output file path.
/// @param model GaussianModel to write. Tensors are moved to CPU internally.
/// @return true on success.
bool write_gaussian_ply(const std::filesystem::path& path,
                        const GaussianModel& model);

/// @brief Read a GaussianModel from a binary PLY file.
///
/// Only the DC SH band is used; colors are 0.5 + C0 * f_dc. Higher-order
/// f_rest_* properties are skipped.
///
/// @param path Input PLY file path.
/// @return Loaded GaussianModel on CPU.
/// @throws std::runtime_error on parse error.
GaussianModel read_gaussian_ply(const std::filesystem::path& path);

} // namespace gstile
