#pragma once

#include "planform/config/configuration.hpp"

#include <functional>
#include <string>
#include <vector>

namespace planform::config {

// Receives one line per defaulted field.
using NoticeSink = std::function<void(const std::string &)>;

// Writes notices to standard output.
NoticeSink stdout_notices();

// Discards notices.
NoticeSink silent_notices();

// "Assigning default value of <field> = <value>"; integral values print
// as integers, others in %e form.
std::string format_default_notice(const std::string &field, double value);

// All defaults, one notice per field.
Planform resolve(const NoticeSink &notices = stdout_notices());

// Fills absent fields from default_params(), then recomputes the
// coordinate grid, cycles_per_pixel and the Gaussian mask.
Planform resolve(const PlanformParams &partial,
                 const NoticeSink &notices = stdout_notices());

// Re-resolves a planform. Nothing is defaulted; derived fields are
// recomputed and stale images dropped.
Planform resolve(const Planform &planform,
                 const NoticeSink &notices = stdout_notices());

// Zero or one YAML document as the configuration argument.
Planform resolve_documents(const std::vector<YAML::Node> &docs,
                           const NoticeSink &notices = stdout_notices());

// Recomputes coord_grid_x/y, cycles_per_pixel and gaussian_mask in place.
void refresh_derived(Planform &planform);

} // namespace planform::config
