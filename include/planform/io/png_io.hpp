#pragma once

#include "planform/core/types.hpp"

#include <filesystem>

namespace planform::io {

namespace fs = std::filesystem;

// 8-bit view of a planform image: [0, gray_scale] -> [0, 255], clamped.
Matrix2Df to_display_range(const Matrix2Dd& img, double gray_scale);

// Writes an 8-bit single-channel PNG.
void write_png_image(const fs::path& path, const Matrix2Dd& img, double gray_scale);

} // namespace planform::io
