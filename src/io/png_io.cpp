#include "planform/io/png_io.hpp"
#include "planform/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace planform::io {

Matrix2Df to_display_range(const Matrix2Dd& img, double gray_scale) {
    if (!(gray_scale > 0.0)) {
        throw ValidationError("gray_scale must be positive for display mapping");
    }
    const double scale = 255.0 / gray_scale;
    return (img * scale).cwiseMax(0.0).cwiseMin(255.0).cast<float>();
}

void write_png_image(const fs::path& path, const Matrix2Dd& img, double gray_scale) {
    if (img.size() <= 0) {
        throw ImageWriteError("empty image: " + path.string());
    }

    Matrix2Df display = to_display_range(img, gray_scale);
    cv::Mat cv_img(static_cast<int>(display.rows()), static_cast<int>(display.cols()),
                   CV_32F, display.data());
    cv::Mat out;
    cv_img.convertTo(out, CV_8U);

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), out);
    } catch (const cv::Exception& e) {
        throw ImageWriteError(path.string() + ": " + e.what());
    }
    if (!ok) {
        throw ImageWriteError("cv::imwrite failed: " + path.string());
    }
}

} // namespace planform::io
