#pragma once

#include "planform/config/configuration.hpp"
#include "planform/core/types.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace planform::io {

namespace fs = std::filesystem;

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

// Planform parameters as FITS keys (NPIX, CYCIMG, GSPACE, GRAYSCL, AMPL,
// BASEANG, LATANG, PHASE, NCOMP) plus PFNAME = image name.
FitsHeader planform_header(const config::Planform& pf, const std::string& image_name);

// Single-HDU FLOAT_IMG; overwrites an existing file.
void write_fits_image(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header);

} // namespace planform::io
