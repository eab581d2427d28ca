#include "utils/ply_io.hpp"
#include "core/gaussian.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace gstile {

namespace {

/// Degree-0 SH basis constant, 1/(2*sqrt(pi)).
constexpr float kSH_C0 = 0.28209479177387814f;

} // namespace

// ---------------------------------------------------------------------------
// Gaussian model PLY writer
// ---------------------------------------------------------------------------

bool write_gaussian_ply(const std::filesystem::path& path,
                        const GaussianModel& model) {
    if (!model.is_valid()) {
        spdlog::error("Cannot write invalid GaussianModel to PLY");
        return false;
    }

    // Move tensors to CPU, contiguous
    auto positions = model.positions.cpu().contiguous().to(torch::kFloat32);
    auto colors    = model.colors.cpu().contiguous().to(torch::kFloat32);
    auto opacities = model.opacities.cpu().contiguous().to(torch::kFloat32);
    auto scales    = model.scales.cpu().contiguous().to(torch::kFloat32);
    auto rotations = model.rotations.cpu().contiguous().to(torch::kFloat32);

    const int64_t n = positions.size(0);

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        spdlog::error("Failed to open PLY file for writing: {}", path.string());
        return false;
    }

    ofs << "ply\n"
        << "format binary_little_endian 1.0\n"
        << "element vertex " << n << "\n"
        << "property float x\n"
        << "property float y\n"
        << "property float z\n"
        << "property float nx\n"
        << "property float ny\n"
        << "property float nz\n"
        << "property float f_dc_0\n"
        << "property float f_dc_1\n"
        << "property float f_dc_2\n"
        << "property float opacity\n"
        << "property float scale_0\n"
        << "property float scale_1\n"
        << "property float scale_2\n"
        << "property float rot_0\n"
        << "property float rot_1\n"
        << "property float rot_2\n"
        << "property float rot_3\n"
        << "end_header\n";

    auto pos_acc = positions.accessor<float, 2>();
    auto col_acc = colors.accessor<float, 2>();
    auto opa_acc = opacities.accessor<float, 2>();
    auto scl_acc = scales.accessor<float, 2>();
    auto rot_acc = rotations.accessor<float, 2>();

    const float zero = 0.0f;

    for (int64_t i = 0; i < n; ++i) {
        ofs.write(reinterpret_cast<const char*>(&pos_acc[i][0]), 3 * sizeof(float));

        // Normals (nx, ny, nz), always zero
        ofs.write(reinterpret_cast<const char*>(&zero), sizeof(float));
        ofs.write(reinterpret_cast<const char*>(&zero), sizeof(float));
        ofs.write(reinterpret_cast<const char*>(&zero), sizeof(float));

        for (int ch = 0; ch < 3; ++ch) {
            const float dc = (col_acc[i][ch] - 0.5f) / kSH_C0;
            ofs.write(reinterpret_cast<const char*>(&dc), sizeof(float));
        }

        ofs.write(reinterpret_cast<const char*>(&opa_acc[i][0]), sizeof(float));
        ofs.write(reinterpret_cast<const char*>(&scl_acc[i][0]), 3 * sizeof(float));
        ofs.write(reinterpret_cast<const char*>(&rot_acc[i][0]), 4 * sizeof(float));
    }

    if (!ofs) {
        spdlog::error("Failed while writing PLY data: {}", path.string());
        return false;
    }

    spdlog::info("Wrote {} Gaussians to PLY: {}", n, path.string());
    return true;
}

// ---------------------------------------------------------------------------
// Gaussian model PLY reader
// ---------------------------------------------------------------------------

namespace {

/// @brief Parsed PLY header: vertex count and property names in order.
struct PlyHeader {
    int64_t vertex_count = 0;
    std::vector<std::string> property_names;
    std::streampos data_offset = 0;
};

PlyHeader parse_ply_header(std::ifstream& ifs) {
    PlyHeader header;
    std::string line;

    std::getline(ifs, line);
    if (line.find("ply") == std::string::npos)
        throw std::runtime_error("Not a PLY file");

    std::getline(ifs, line);
    if (line.find("binary_little_endian") == std::string::npos)
        throw std::runtime_error("Only binary_little_endian PLY is supported");

    bool in_vertex = false;
    bool found_end = false;
    while (std::getline(ifs, line)) {
        // Trim carriage return if present (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (line == "end_header") {
            header.data_offset = ifs.tellg();
            found_end = true;
            break;
        }

        std::istringstream iss(line);
        std::string token;
        iss >> token;

        if (token == "element") {
            std::string elem_type;
            int64_t count = 0;
            iss >> elem_type >> count;
            in_vertex = (elem_type == "vertex");
            if (in_vertex) {
                if (count < 0)
                    throw std::runtime_error("Negative vertex count in PLY header");
                header.vertex_count = count;
            }
        } else if (token == "property" && in_vertex) {
            std::string dtype, name;
            iss >> dtype >> name;
            if (dtype != "float" && dtype != "float32")
                throw std::runtime_error("Unsupported PLY property type '" + dtype +
                                         "' for " + name + " (only float)");
            header.property_names.push_back(name);
        }
    }

    if (!found_end)
        throw std::runtime_error("PLY header is missing end_header");

    return header;
}

} // anonymous namespace

GaussianModel read_gaussian_ply(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        throw std::runtime_error("Failed to open PLY file: " + path.string());

    auto header = parse_ply_header(ifs);
    const int64_t n = header.vertex_count;

    std::unordered_map<std::string, int> prop_index;
    for (int i = 0; i < static_cast<int>(header.property_names.size()); ++i) {
        prop_index[header.property_names[i]] = i;
    }

    const int num_props = static_cast<int>(header.property_names.size());

    auto index_of = [&](const std::string& name) -> int {
        auto it = prop_index.find(name);
        if (it == prop_index.end())
            throw std::runtime_error("Missing PLY property: " + name);
        return it->second;
    };

    const int ix[3] = {index_of("x"), index_of("y"), index_of("z")};
    const int idc[3] = {index_of("f_dc_0"), index_of("f_dc_1"), index_of("f_dc_2")};
    const int iop = index_of("opacity");
    const int isc[3] = {index_of("scale_0"), index_of("scale_1"), index_of("scale_2")};
    const int irot[4] = {index_of("rot_0"), index_of("rot_1"), index_of("rot_2"),
                         index_of("rot_3")};

    spdlog::info("Reading PLY: {} vertices, {} properties", n, num_props);

    // Read all vertex data as flat float buffer (all properties are float)
    std::vector<float> buffer(static_cast<size_t>(n * num_props));
    ifs.seekg(header.data_offset);
    ifs.read(reinterpret_cast<char*>(buffer.data()),
             static_cast<std::streamsize>(buffer.size() * sizeof(float)));
    if (!ifs)
        throw std::runtime_error("Failed to read PLY binary data: " + path.string());

    GaussianModel model;
    model.positions = torch::zeros({n, 3}, torch::kFloat32);
    model.colors    = torch::zeros({n, 3}, torch::kFloat32);
    model.opacities = torch::zeros({n, 1}, torch::kFloat32);
    model.scales    = torch::zeros({n, 3}, torch::kFloat32);
    model.rotations = torch::zeros({n, 4}, torch::kFloat32);

    auto pos_acc = model.positions.accessor<float, 2>();
    auto col_acc = model.colors.accessor<float, 2>();
    auto opa_acc = model.opacities.accessor<float, 2>();
    auto scl_acc = model.scales.accessor<float, 2>();
    auto rot_acc = model.rotations.accessor<float, 2>();

    for (int64_t i = 0; i < n; ++i) {
        const float* row = buffer.data() + i * num_props;
        for (int k = 0; k < 3; ++k) {
            pos_acc[i][k] = row[ix[k]];
            col_acc[i][k] = 0.5f + kSH_C0 * row[idc[k]];
            scl_acc[i][k] = row[isc[k]];
        }
        opa_acc[i][0] = row[iop];
        for (int k = 0; k < 4; ++k) {
            rot_acc[i][k] = row[irot[k]];
        }
    }

    spdlog::info("Loaded {} Gaussians from PLY: {}", n, path.string());
    return model;
}

} // namespace gstile
