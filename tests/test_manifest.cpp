#include "planform/config/resolver.hpp"
#include "planform/core/errors.hpp"
#include "planform/core/utils.hpp"
#include "planform/runner/manifest.hpp"
#include "planform/synthesis/generator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <fitsio.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using planform::config::Planform;
using planform::config::PlanformParams;
using planform::runner::ExportFormat;

namespace {

fs::path fresh_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("planform_test_" + name);
    fs::remove_all(dir);
    return dir;
}

Planform small_planform(int components) {
    PlanformParams p;
    p.image_size_px = 16;
    p.component_count = components;
    Planform pf = planform::config::resolve(p, planform::config::silent_notices());
    planform::synthesis::generate_inplace(pf);
    return pf;
}

} // namespace

TEST_CASE("sha256_file_matches_known_digest") {
    const fs::path dir = fresh_dir("sha");
    fs::create_directories(dir);
    planform::core::write_text(dir / "abc.txt", "abc");
    planform::core::write_text(dir / "empty.txt", "");

    REQUIRE(planform::core::sha256_file(dir / "abc.txt") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(planform::core::sha256_file(dir / "empty.txt") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    // Larger than one read chunk.
    planform::core::write_text(dir / "big.txt", std::string(40000, 'a'));
    const std::string big = planform::core::sha256_file(dir / "big.txt");
    REQUIRE(big.size() == 64);
    REQUIRE(big != planform::core::sha256_file(dir / "abc.txt"));

    REQUIRE_THROWS_AS(planform::core::sha256_file(dir / "missing.txt"), planform::IOError);
    fs::remove_all(dir);
}

TEST_CASE("parse_export_format_accepts_known_names_only") {
    REQUIRE(planform::runner::parse_export_format("png") == ExportFormat::PNG);
    REQUIRE(planform::runner::parse_export_format("FITS") == ExportFormat::FITS);
    REQUIRE(planform::runner::parse_export_format("Both") == ExportFormat::BOTH);
    REQUIRE_THROWS_AS(planform::runner::parse_export_format("tiff"),
                      planform::ValidationError);
}

TEST_CASE("params_json_carries_resolved_fields") {
    Planform pf = planform::config::resolve(planform::config::silent_notices());
    auto j = planform::runner::params_to_json(pf);
    REQUIRE(j["image_size_px"].get<int>() == 600);
    REQUIRE(j["component_count"].get<int>() == 4);
    REQUIRE(j["cycles_per_pixel"].get<double>() == Catch::Approx(0.02));
    REQUIRE(j["lattice_angle"].get<double>() == Catch::Approx(0.3217505544));

    auto d = planform::runner::defaults_to_json(planform::config::default_params());
    REQUIRE(d["gaussian_space_constant"].get<double>() == 1800.0);
    REQUIRE_FALSE(d.contains("cycles_per_pixel"));
}

TEST_CASE("stats_report_lists_every_image") {
    Planform pf = small_planform(6);
    auto report = planform::runner::stats_report(pf);
    REQUIRE(report.size() == 10);
    for (const auto& [name, img] : pf.images) {
        REQUIRE(report.contains(name));
        REQUIRE(report[name]["rows"].get<int>() == 16);
        REQUIRE(report[name]["max"].get<double>() <= pf.gray_scale);
        REQUIRE(report[name]["min"].get<double>() >= 0.0);
    }
}

TEST_CASE("export_requires_generated_images") {
    Planform pf = planform::config::resolve(planform::config::silent_notices());
    REQUIRE_THROWS_AS(
        planform::runner::export_images(pf, fresh_dir("empty"), ExportFormat::PNG, "pf"),
        planform::ValidationError);
}

TEST_CASE("fits_export_writes_pixels_and_header_keys") {
    Planform pf = small_planform(4);
    const fs::path dir = fresh_dir("fits");

    std::vector<std::string> written;
    auto manifest = planform::runner::export_images(
        pf, dir, ExportFormat::FITS, "sq",
        [&](const std::string& name, const fs::path&) { written.push_back(name); });

    REQUIRE(written.size() == 7);
    REQUIRE(fs::exists(dir / "manifest.json"));
    REQUIRE(manifest["files"].size() == 7);
    REQUIRE(manifest["topology"].get<std::string>() == "SQUARE");

    const fs::path p1234 = dir / "sq_P1234.fits";
    REQUIRE(fs::exists(p1234));

    fitsfile* fptr = nullptr;
    int status = 0;
    REQUIRE(fits_open_file(&fptr, p1234.string().c_str(), READONLY, &status) == 0);

    int naxis = 0;
    long naxes[2] = {0, 0};
    int bitpix = 0;
    fits_get_img_param(fptr, 2, &bitpix, &naxis, naxes, &status);
    REQUIRE(status == 0);
    REQUIRE(bitpix == FLOAT_IMG);
    REQUIRE(naxis == 2);
    REQUIRE(naxes[0] == 16);
    REQUIRE(naxes[1] == 16);

    std::vector<float> pixels(16 * 16);
    long fpixel[2] = {1, 1};
    fits_read_pix(fptr, TFLOAT, fpixel, 16 * 16, nullptr, pixels.data(), nullptr, &status);
    REQUIRE(status == 0);

    int ncomp = 0;
    int npix = 0;
    double grayscl = 0.0;
    char pfname[FLEN_VALUE] = {0};
    fits_read_key(fptr, TINT, "NCOMP", &ncomp, nullptr, &status);
    fits_read_key(fptr, TINT, "NPIX", &npix, nullptr, &status);
    fits_read_key(fptr, TDOUBLE, "GRAYSCL", &grayscl, nullptr, &status);
    fits_read_key(fptr, TSTRING, "PFNAME", pfname, nullptr, &status);
    REQUIRE(status == 0);
    fits_close_file(fptr, &status);

    // Row y is stored at offset y * width.
    const auto& expected = pf.images.at("P1234");
    for (int y = 0; y < 16; ++y) {
        for (int x = 0; x < 16; ++x) {
            REQUIRE(pixels[static_cast<size_t>(y * 16 + x)] ==
                    Catch::Approx(expected(y, x)).epsilon(1e-6));
        }
    }
    REQUIRE(ncomp == 4);
    REQUIRE(npix == 16);
    REQUIRE(grayscl == Catch::Approx(255.0));
    REQUIRE(std::string(pfname) == "P1234");

    for (const auto& entry : manifest["files"]) {
        const fs::path file = dir / entry["file"].get<std::string>();
        REQUIRE(entry["sha256"].get<std::string>() == planform::core::sha256_file(file));
    }

    fs::remove_all(dir);
}

TEST_CASE("both_formats_write_png_and_fits_per_image") {
    Planform pf = small_planform(6);
    const fs::path dir = fresh_dir("both");

    auto manifest = planform::runner::export_images(pf, dir, ExportFormat::BOTH, "hex");
    REQUIRE(manifest["files"].size() == 20);
    REQUIRE(fs::exists(dir / "hex_P123456.png"));
    REQUIRE(fs::exists(dir / "hex_C6.fits"));

    std::ifstream in(dir / "manifest.json");
    auto reread = nlohmann::json::parse(in);
    REQUIRE(reread["params"]["component_count"].get<int>() == 6);

    fs::remove_all(dir);
}
