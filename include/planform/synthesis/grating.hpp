#pragma once

#include "planform/core/types.hpp"

#include <utility>

namespace planform::synthesis {

// Plane cosine grating: amplitude * cos(a*X + b*Y + phase) with
// a = cos(angle)*f, b = sin(angle)*f, f = 2*pi*cycles_per_pixel.
Matrix2Dd grating(const Matrix2Dd& coord_x, const Matrix2Dd& coord_y,
                  double amplitude, double phase, double angle,
                  double cycles_per_pixel);

// Origin-anchored pixel grid: X(i,j) = j, Y(i,j) = i.
std::pair<Matrix2Dd, Matrix2Dd> coordinate_grid(int image_size_px);

// Isotropic Gaussian over centered coordinates spanning
// [-N/2, N/2] on both axes: exp(-(x^2 + y^2) / space_constant^2).
Matrix2Dd gaussian_mask(int image_size_px, double space_constant);

} // namespace planform::synthesis
