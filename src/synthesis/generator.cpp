#include "planform/synthesis/generator.hpp"
#include "planform/synthesis/grating.hpp"
#include "planform/image/processing.hpp"
#include "planform/core/errors.hpp"

#include <cmath>
#include <utility>

namespace planform::synthesis {

namespace {

double pair_angle_for(Topology topology) {
    // C1/C2 and C3/C4 are orthogonal for squares; hexagonal pairs are
    // spread by 2*pi/3.
    return topology == Topology::HEXAGONAL ? 2.0 * M_PI / 3.0 : M_PI / 2.0;
}

Topology require_topology(int component_count) {
    const Topology topology = topology_from_count(component_count);
    if (topology == Topology::UNSUPPORTED) {
        throw UnsupportedTopologyError(component_count);
    }
    return topology;
}

const Matrix2Dd& component(const ImageSet& raw, const char* name) {
    return raw.at(name);
}

Matrix2Dd pair_mean(const ImageSet& raw, const char* a, const char* b) {
    return image::mean_of({&component(raw, a), &component(raw, b)});
}

} // namespace

std::vector<ComponentSpec> lattice_components(int component_count,
                                              double lattice_angle) {
    const Topology topology = require_topology(component_count);
    const double pair = pair_angle_for(topology);
    const double L = lattice_angle;

    // C1, C2 rotated by +L about their axes; C3, C4 by -L.
    std::vector<ComponentSpec> specs = {
        {"C1", 0.0, L, false},
        {"C2", pair, L, false},
        {"C3", pair, -L, true},
        {"C4", 0.0, -L, true},
    };

    if (topology == Topology::HEXAGONAL) {
        // phase_offset is not applied to any hexagonal component.
        for (auto& s : specs) {
            s.use_phase_offset = false;
        }
        specs.push_back({"C5", 2.0 * pair, L, false});
        specs.push_back({"C6", 2.0 * pair, -L, false});
    }
    return specs;
}

ImageSet synthesize_components(const config::Planform& pf) {
    ImageSet raw;
    for (const auto& spec : lattice_components(pf.component_count, pf.lattice_angle)) {
        const double phase = spec.use_phase_offset ? pf.phase_offset : 0.0;
        const double angle = pf.base_angle_offset + spec.axis + spec.offset;
        raw.emplace(spec.name, grating(pf.coord_grid_x, pf.coord_grid_y,
                                       pf.amplitude, phase, angle,
                                       pf.cycles_per_pixel));
    }
    return raw;
}

ImageSet generate(const config::Planform& pf) {
    const Topology topology = require_topology(pf.component_count);
    const ImageSet raw = synthesize_components(pf);
    const Matrix2Dd& mask = pf.gaussian_mask;
    const double gs = pf.gray_scale;

    ImageSet img;

    if (topology == Topology::SQUARE) {
        const Matrix2Dd all = image::mean_of({&component(raw, "C1"), &component(raw, "C2"),
                                              &component(raw, "C3"), &component(raw, "C4")});
        img["P1234"] = image::masked_gray(all, mask, gs);
        img["P12"] = image::masked_gray(pair_mean(raw, "C1", "C2"), mask, gs);
        img["P34"] = image::masked_gray(pair_mean(raw, "C3", "C4"), mask, gs);
    } else {
        const Matrix2Dd all = image::mean_of({&component(raw, "C1"), &component(raw, "C2"),
                                              &component(raw, "C3"), &component(raw, "C4"),
                                              &component(raw, "C5"), &component(raw, "C6")});
        img["P123456"] = image::masked_gray(all, mask, gs);
        img["P12"] = image::masked_gray(pair_mean(raw, "C1", "C2"), mask, gs);
        img["P34"] = image::masked_gray(pair_mean(raw, "C3", "C4"), mask, gs);
        img["P56"] = image::masked_gray(pair_mean(raw, "C5", "C6"), mask, gs);

        // Stored under C5/C6 but built from C3/C4.
        img["C5"] = image::masked_gray(component(raw, "C3"), mask, gs);
        img["C6"] = image::masked_gray(component(raw, "C4"), mask, gs);
    }

    for (const char* name : {"C1", "C2", "C3", "C4"}) {
        img[name] = image::masked_gray(component(raw, name), mask, gs);
    }

    return img;
}

void generate_inplace(config::Planform& pf) {
    ImageSet img = generate(pf);
    pf.images = std::move(img);
}

std::vector<std::string> output_names(int component_count) {
    switch (require_topology(component_count)) {
        case Topology::SQUARE:
            return {"C1", "C2", "C3", "C4", "P12", "P34", "P1234"};
        case Topology::HEXAGONAL:
            return {"C1", "C2", "C3", "C4", "C5", "C6", "P12", "P34", "P56", "P123456"};
        default:
            throw UnsupportedTopologyError(component_count);
    }
}

} // namespace planform::synthesis
