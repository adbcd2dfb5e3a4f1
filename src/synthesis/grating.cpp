#include "planform/synthesis/grating.hpp"
#include "planform/image/processing.hpp"

#include <algorithm>
#include <cmath>

namespace planform::synthesis {

Matrix2Dd grating(const Matrix2Dd& coord_x, const Matrix2Dd& coord_y,
                  double amplitude, double phase, double angle,
                  double cycles_per_pixel) {
    const double f = cycles_per_pixel * 2.0 * M_PI;
    const double a = std::cos(angle) * f;
    const double b = std::sin(angle) * f;

    Matrix2Dd out = a * coord_x + b * coord_y;
    out.array() += phase;
    out = out.array().cos().matrix() * amplitude;
    return out;
}

std::pair<Matrix2Dd, Matrix2Dd> coordinate_grid(int image_size_px) {
    const int n = std::max(0, image_size_px);
    VectorXd axis(n);
    for (int i = 0; i < n; ++i) {
        axis[i] = static_cast<double>(i);
    }
    return image::meshgrid(axis, axis);
}

Matrix2Dd gaussian_mask(int image_size_px, double space_constant) {
    const double half = static_cast<double>(image_size_px) / 2.0;
    const VectorXd axis = image::linspace(-half, half, image_size_px);
    auto [x, y] = image::meshgrid(axis, axis);

    const double denom = space_constant * space_constant;
    Matrix2Dd r2 = x.cwiseProduct(x) + y.cwiseProduct(y);
    return (-r2.array() / denom).exp().matrix();
}

} // namespace planform::synthesis
