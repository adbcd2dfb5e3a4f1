#include "planform/config/resolver.hpp"
#include "planform/synthesis/grating.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace planform::config {

namespace {

template <typename T>
void assign_default(std::optional<T>& field, T value, const char* name,
                    const NoticeSink& notices) {
    if (field.has_value()) {
        return;
    }
    field = value;
    if (notices) {
        notices(format_default_notice(name, static_cast<double>(value)));
    }
}

} // namespace

NoticeSink stdout_notices() {
    return [](const std::string& line) { std::cout << line << std::endl; };
}

NoticeSink silent_notices() {
    return [](const std::string&) {};
}

std::string format_default_notice(const std::string& field, double value) {
    std::ostringstream oss;
    oss << "Assigning default value of " << field << " = ";
    if (std::isfinite(value) && value == std::trunc(value) && std::fabs(value) < 1e15) {
        oss << static_cast<long long>(value);
    } else {
        oss << std::scientific << std::setprecision(6) << value;
    }
    return oss.str();
}

void refresh_derived(Planform& pf) {
    auto [x, y] = synthesis::coordinate_grid(pf.image_size_px);
    pf.coord_grid_x = std::move(x);
    pf.coord_grid_y = std::move(y);
    pf.cycles_per_pixel = pf.cycles_per_image / static_cast<double>(pf.image_size_px);
    pf.gaussian_mask = synthesis::gaussian_mask(pf.image_size_px, pf.gaussian_space_constant);
}

Planform resolve(const NoticeSink& notices) {
    return resolve(PlanformParams{}, notices);
}

Planform resolve(const PlanformParams& partial, const NoticeSink& notices) {
    const PlanformDefaults d = default_params();
    PlanformParams p = partial;

    assign_default(p.image_size_px, d.image_size_px, "image_size_px", notices);
    assign_default(p.cycles_per_image, d.cycles_per_image, "cycles_per_image", notices);
    assign_default(p.gaussian_space_constant, d.gaussian_space_constant,
                   "gaussian_space_constant", notices);
    assign_default(p.gray_scale, d.gray_scale, "gray_scale", notices);
    assign_default(p.amplitude, d.amplitude, "amplitude", notices);
    assign_default(p.base_angle_offset, d.base_angle_offset, "base_angle_offset", notices);
    assign_default(p.lattice_angle, d.lattice_angle, "lattice_angle", notices);
    assign_default(p.phase_offset, d.phase_offset, "phase_offset", notices);
    assign_default(p.component_count, d.component_count, "component_count", notices);

    Planform pf;
    pf.image_size_px = *p.image_size_px;
    pf.cycles_per_image = *p.cycles_per_image;
    pf.gaussian_space_constant = *p.gaussian_space_constant;
    pf.gray_scale = *p.gray_scale;
    pf.amplitude = *p.amplitude;
    pf.base_angle_offset = *p.base_angle_offset;
    pf.lattice_angle = *p.lattice_angle;
    pf.phase_offset = *p.phase_offset;
    pf.component_count = *p.component_count;

    refresh_derived(pf);
    return pf;
}

Planform resolve(const Planform& planform, const NoticeSink& notices) {
    return resolve(planform.to_params(), notices);
}

Planform resolve_documents(const std::vector<YAML::Node>& docs, const NoticeSink& notices) {
    return resolve(PlanformParams::from_documents(docs), notices);
}

} // namespace planform::config
