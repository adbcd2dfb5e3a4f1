#include "planform/image/processing.hpp"
#include "planform/core/errors.hpp"

#include <cmath>
#include <limits>

namespace planform::image {

VectorXd linspace(double lo, double hi, int n) {
    if (n <= 0) {
        return VectorXd();
    }
    if (n == 1) {
        VectorXd v(1);
        v[0] = 0.5 * (lo + hi);
        return v;
    }
    VectorXd v(n);
    const double step = (hi - lo) / static_cast<double>(n - 1);
    for (int i = 0; i < n; ++i) {
        v[i] = lo + step * static_cast<double>(i);
    }
    // Pin the end point so it does not drift with rounding.
    v[n - 1] = hi;
    return v;
}

std::pair<Matrix2Dd, Matrix2Dd> meshgrid(const VectorXd& xs, const VectorXd& ys) {
    const Eigen::Index rows = ys.size();
    const Eigen::Index cols = xs.size();
    Matrix2Dd X(rows, cols);
    Matrix2Dd Y(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        X.row(i) = xs.transpose();
    }
    for (Eigen::Index j = 0; j < cols; ++j) {
        Y.col(j) = ys;
    }
    return {X, Y};
}

Matrix2Dd apply_mask(const Matrix2Dd& img, const Matrix2Dd& mask) {
    if (img.rows() != mask.rows() || img.cols() != mask.cols()) {
        throw ValidationError("mask shape " + std::to_string(mask.rows()) + "x" +
                              std::to_string(mask.cols()) + " does not match image " +
                              std::to_string(img.rows()) + "x" + std::to_string(img.cols()));
    }
    return img.cwiseProduct(mask);
}

Matrix2Dd mean_of(const std::vector<const Matrix2Dd*>& images) {
    if (images.empty()) {
        return Matrix2Dd();
    }
    Matrix2Dd sum = *images.front();
    for (size_t k = 1; k < images.size(); ++k) {
        sum += *images[k];
    }
    return sum / static_cast<double>(images.size());
}

Matrix2Dd to_gray_levels(const Matrix2Dd& img, double gray_scale) {
    const double half = gray_scale / 2.0;
    return ((img * half).array() + half).matrix();
}

Matrix2Dd masked_gray(const Matrix2Dd& img, const Matrix2Dd& mask, double gray_scale) {
    return to_gray_levels(apply_mask(img, mask), gray_scale);
}

ImageStats image_stats(const Matrix2Dd& img) {
    ImageStats s{0.0, 0.0, 0.0, 0.0};
    const Eigen::Index n = img.size();
    if (n <= 0) {
        return s;
    }

    double mean = 0.0;
    double m2 = 0.0;
    double min_v = std::numeric_limits<double>::infinity();
    double max_v = -std::numeric_limits<double>::infinity();
    Eigen::Index count = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const double v = img.data()[i];
        if (v < min_v) min_v = v;
        if (v > max_v) max_v = v;
        ++count;
        const double delta = v - mean;
        mean += delta / static_cast<double>(count);
        m2 += delta * (v - mean);
    }

    s.min = min_v;
    s.max = max_v;
    s.mean = mean;
    s.stddev = (count > 1) ? std::sqrt(m2 / static_cast<double>(count - 1)) : 0.0;
    return s;
}

} // namespace planform::image
