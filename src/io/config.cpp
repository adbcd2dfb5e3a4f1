#include "planform/config/configuration.hpp"
#include "planform/core/errors.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

namespace planform::config {

template <typename T>
static void read_optional(const YAML::Node& node, const char* key, std::optional<T>& out) {
    const YAML::Node n = node[key];
    if (!n || n.IsNull()) {
        return;
    }
    if (!n.IsScalar()) {
        throw InvalidInputError(std::string(key) + " must be a scalar");
    }
    try {
        out = n.as<T>();
    } catch (const YAML::Exception& e) {
        throw InvalidInputError(std::string(key) + ": " + e.what());
    }
}

PlanformDefaults default_params() {
    return PlanformDefaults{};
}

PlanformParams PlanformParams::from_yaml(const YAML::Node& node) {
    PlanformParams p;

    if (!node || node.IsNull()) {
        return p;
    }
    if (!node.IsMap()) {
        throw InvalidInputError("expected a mapping of planform fields");
    }

    read_optional(node, "image_size_px", p.image_size_px);
    read_optional(node, "cycles_per_image", p.cycles_per_image);
    read_optional(node, "gaussian_space_constant", p.gaussian_space_constant);
    read_optional(node, "gray_scale", p.gray_scale);
    read_optional(node, "amplitude", p.amplitude);
    read_optional(node, "base_angle_offset", p.base_angle_offset);
    read_optional(node, "lattice_angle", p.lattice_angle);
    read_optional(node, "phase_offset", p.phase_offset);
    read_optional(node, "component_count", p.component_count);

    return p;
}

PlanformParams PlanformParams::from_documents(const std::vector<YAML::Node>& docs) {
    if (docs.size() > 1) {
        throw TooManyArgumentsError("expected at most one configuration, got " +
                                    std::to_string(docs.size()));
    }
    if (docs.empty()) {
        return PlanformParams{};
    }
    return from_yaml(docs.front());
}

PlanformParams PlanformParams::load(const fs::path& path) {
    std::error_code ec;
    const fs::file_status st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) {
        throw ConfigError("Config file not found: " + path.string());
    }
    if (ec) {
        throw ConfigError("Cannot access " + path.string() + ": " + ec.message());
    }
    if (!fs::is_regular_file(st)) {
        throw ConfigError("Config path is not a regular file: " + path.string());
    }

    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAllFromFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_documents(docs);
}

PlanformParams PlanformParams::load(std::istream& in) {
    std::vector<YAML::Node> docs;
    try {
        docs = YAML::LoadAll(in);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Cannot parse config stream: ") + e.what());
    }
    return from_documents(docs);
}

PlanformParams Planform::to_params() const {
    PlanformParams p;
    p.image_size_px = image_size_px;
    p.cycles_per_image = cycles_per_image;
    p.gaussian_space_constant = gaussian_space_constant;
    p.gray_scale = gray_scale;
    p.amplitude = amplitude;
    p.base_angle_offset = base_angle_offset;
    p.lattice_angle = lattice_angle;
    p.phase_offset = phase_offset;
    p.component_count = component_count;
    return p;
}

void Planform::validate() const {
    if (image_size_px <= 0) {
        throw ValidationError("image_size_px must be positive");
    }
    if (!(cycles_per_image > 0.0) || !std::isfinite(cycles_per_image)) {
        throw ValidationError("cycles_per_image must be positive");
    }
    if (!(gaussian_space_constant > 0.0) || !std::isfinite(gaussian_space_constant)) {
        throw ValidationError("gaussian_space_constant must be positive");
    }
    if (!(gray_scale > 0.0) || !std::isfinite(gray_scale)) {
        throw ValidationError("gray_scale must be positive");
    }
    if (!std::isfinite(amplitude)) {
        throw ValidationError("amplitude must be finite");
    }
    if (!std::isfinite(base_angle_offset) || !std::isfinite(lattice_angle) ||
        !std::isfinite(phase_offset)) {
        throw ValidationError("base_angle_offset, lattice_angle and phase_offset must be finite");
    }
    if (component_count != 4 && component_count != 6) {
        throw ValidationError("component_count must be 4 or 6");
    }

    const auto n = static_cast<Eigen::Index>(image_size_px);
    if (coord_grid_x.rows() != n || coord_grid_x.cols() != n ||
        coord_grid_y.rows() != n || coord_grid_y.cols() != n ||
        gaussian_mask.rows() != n || gaussian_mask.cols() != n) {
        throw ValidationError("derived grids are stale; resolve the planform again");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "image_size_px": {"type": "integer", "minimum": 1, "default": 600},
    "cycles_per_image": {"type": "number", "exclusiveMinimum": 0, "default": 12},
    "gaussian_space_constant": {"type": "number", "exclusiveMinimum": 0, "default": 1800},
    "gray_scale": {"type": "number", "exclusiveMinimum": 0, "default": 255},
    "amplitude": {"type": "number", "default": 1},
    "base_angle_offset": {"type": "number", "default": 0},
    "lattice_angle": {"type": "number", "default": 0.3217505543966422},
    "phase_offset": {"type": "number", "default": 0},
    "component_count": {"type": "integer", "enum": [4, 6], "default": 4}
  }
})";
}

} // namespace planform::config
