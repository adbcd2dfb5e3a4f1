#pragma once

#include "planform/core/types.hpp"

#include <cmath>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace planform::config {

namespace fs = std::filesystem;

// Values substituted for absent fields. Never changes at runtime.
struct PlanformDefaults {
  int image_size_px = 600;
  double cycles_per_image = 12.0;
  double gaussian_space_constant = 3.0 * 600; // no edge blurring at 600 px
  double gray_scale = 255.0;
  double amplitude = 1.0;
  double base_angle_offset = 0.0;
  double lattice_angle = std::atan2(1.0, 3.0); // 3:1 lattice
  double phase_offset = 0.0;   // square; pi gives super-square
  int component_count = 4;
  double pair_angle_offset = 0.0; // carried for parity, not applied
};

PlanformDefaults default_params();

// Partial configuration: every user-facing field may be absent.
struct PlanformParams {
  std::optional<int> image_size_px;
  std::optional<double> cycles_per_image;
  std::optional<double> gaussian_space_constant;
  std::optional<double> gray_scale;
  std::optional<double> amplitude;
  std::optional<double> base_angle_offset;
  std::optional<double> lattice_angle;
  std::optional<double> phase_offset;
  std::optional<int> component_count;

  // Reads a YAML mapping. Unknown keys are ignored, a null node yields
  // an empty record, anything other than a mapping is InvalidInputError.
  static PlanformParams from_yaml(const YAML::Node &node);

  // Zero or one YAML document; more is TooManyArgumentsError.
  static PlanformParams from_documents(const std::vector<YAML::Node> &docs);

  static PlanformParams load(const fs::path &path);
  static PlanformParams load(std::istream &in);
};

// Fully resolved planform record.
struct Planform {
  int image_size_px = 0;
  Matrix2Dd coord_grid_x;
  Matrix2Dd coord_grid_y;
  double cycles_per_image = 0.0;
  double cycles_per_pixel = 0.0;
  double gaussian_space_constant = 0.0;
  Matrix2Dd gaussian_mask;
  double gray_scale = 0.0;
  double amplitude = 0.0;
  double base_angle_offset = 0.0;
  double lattice_angle = 0.0;
  double phase_offset = 0.0;
  int component_count = 0;

  // Filled by generation only.
  ImageSet images;

  // All nine user-facing fields set from this record.
  PlanformParams to_params() const;

  // Domain checks the resolver leaves to the caller.
  void validate() const;
};

std::string get_schema_json();

} // namespace planform::config
