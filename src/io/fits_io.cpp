#include "planform/io/fits_io.hpp"
#include "planform/core/errors.hpp"

#include <fitsio.h>
#include <vector>

namespace planform::io {

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

FitsHeader planform_header(const config::Planform& pf, const std::string& image_name) {
    FitsHeader h;
    h.set("NPIX", pf.image_size_px);
    h.set("CYCIMG", pf.cycles_per_image);
    h.set("GSPACE", pf.gaussian_space_constant);
    h.set("GRAYSCL", pf.gray_scale);
    h.set("AMPL", pf.amplitude);
    h.set("BASEANG", pf.base_angle_offset);
    h.set("LATANG", pf.lattice_angle);
    h.set("PHASE", pf.phase_offset);
    h.set("NCOMP", pf.component_count);
    h.set("PFNAME", image_name);
    return h;
}

void write_fits_image(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, FLOAT_IMG, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header keys: " + path.string());
    }

    std::vector<float> buffer(static_cast<size_t>(data.size()));
    for (long y = 0; y < data.rows(); ++y) {
        for (long x = 0; x < data.cols(); ++x) {
            buffer[static_cast<size_t>(y * data.cols() + x)] = static_cast<float>(data(y, x));
        }
    }

    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), buffer.data(), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace planform::io
