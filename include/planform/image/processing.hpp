#pragma once

#include "planform/core/types.hpp"

#include <utility>
#include <vector>

namespace planform::image {

// n evenly spaced samples over [lo, hi]. A single sample sits at the midpoint.
VectorXd linspace(double lo, double hi, int n);

// Grid pair built from axis samples: X(i,j) = xs[j], Y(i,j) = ys[i].
std::pair<Matrix2Dd, Matrix2Dd> meshgrid(const VectorXd& xs, const VectorXd& ys);

// Elementwise product of an image with a mask of the same shape.
Matrix2Dd apply_mask(const Matrix2Dd& img, const Matrix2Dd& mask);

// Elementwise mean of equally shaped images.
Matrix2Dd mean_of(const std::vector<const Matrix2Dd*>& images);

// Maps a signal nominally in [-1,1] to [0, gray_scale].
Matrix2Dd to_gray_levels(const Matrix2Dd& img, double gray_scale);

// Masks then maps to gray levels, the last step for every output image.
Matrix2Dd masked_gray(const Matrix2Dd& img, const Matrix2Dd& mask, double gray_scale);

ImageStats image_stats(const Matrix2Dd& img);

} // namespace planform::image
