#pragma once

#include "planform/config/configuration.hpp"
#include "planform/core/types.hpp"

#include <string>
#include <vector>

namespace planform::synthesis {

// One grating of a lattice, relative to base_angle_offset.
struct ComponentSpec {
  std::string name;       // "C1".."C6"
  double axis = 0.0;      // multiple of the pair angle
  double offset = 0.0;    // +/- lattice_angle
  bool use_phase_offset = false;
};

// Component layout for a topology. Throws UnsupportedTopologyError
// for component counts other than 4 and 6.
std::vector<ComponentSpec> lattice_components(int component_count,
                                              double lattice_angle);

// Raw (unmasked, unnormalized) gratings keyed by component name.
ImageSet synthesize_components(const config::Planform& pf);

// Builds the named output images from a resolved planform.
// 4 components: C1..C4, P12, P34, P1234.
// 6 components: C1..C6, P12, P34, P56, P123456. The images stored as
// C5 and C6 are built from components C3 and C4; the true C5/C6 gratings
// only enter P56 and P123456. Existing callers depend on this output.
ImageSet generate(const config::Planform& pf);

// generate() and attach the result to pf.images. pf is untouched on failure.
void generate_inplace(config::Planform& pf);

// Output names in generation order for a topology.
std::vector<std::string> output_names(int component_count);

} // namespace planform::synthesis
