#include "planform/runner/manifest.hpp"
#include "planform/core/errors.hpp"
#include "planform/core/utils.hpp"
#include "planform/image/processing.hpp"
#include "planform/io/fits_io.hpp"
#include "planform/io/png_io.hpp"

namespace planform::runner {

using json = nlohmann::json;

ExportFormat parse_export_format(const std::string& s) {
    const std::string norm = core::to_lower(s);
    if (norm == "png") return ExportFormat::PNG;
    if (norm == "fits") return ExportFormat::FITS;
    if (norm == "both") return ExportFormat::BOTH;
    throw ValidationError("export format must be 'png', 'fits' or 'both', got '" + s + "'");
}

json params_to_json(const config::Planform& pf) {
    return {
        {"image_size_px", pf.image_size_px},
        {"cycles_per_image", pf.cycles_per_image},
        {"cycles_per_pixel", pf.cycles_per_pixel},
        {"gaussian_space_constant", pf.gaussian_space_constant},
        {"gray_scale", pf.gray_scale},
        {"amplitude", pf.amplitude},
        {"base_angle_offset", pf.base_angle_offset},
        {"lattice_angle", pf.lattice_angle},
        {"phase_offset", pf.phase_offset},
        {"component_count", pf.component_count},
    };
}

json defaults_to_json(const config::PlanformDefaults& d) {
    return {
        {"image_size_px", d.image_size_px},
        {"cycles_per_image", d.cycles_per_image},
        {"gaussian_space_constant", d.gaussian_space_constant},
        {"gray_scale", d.gray_scale},
        {"amplitude", d.amplitude},
        {"base_angle_offset", d.base_angle_offset},
        {"lattice_angle", d.lattice_angle},
        {"phase_offset", d.phase_offset},
        {"component_count", d.component_count},
    };
}

json stats_to_json(const ImageStats& s) {
    return {
        {"min", s.min},
        {"max", s.max},
        {"mean", s.mean},
        {"stddev", s.stddev},
    };
}

json stats_report(const config::Planform& pf) {
    json out = json::object();
    for (const auto& [name, img] : pf.images) {
        json entry = stats_to_json(image::image_stats(img));
        entry["rows"] = img.rows();
        entry["cols"] = img.cols();
        out[name] = entry;
    }
    return out;
}

json export_images(const config::Planform& pf,
                   const fs::path& out_dir,
                   ExportFormat format,
                   const std::string& prefix,
                   const ImageWrittenCallback& on_written) {
    if (pf.images.empty()) {
        throw ValidationError("planform has no images; generate before exporting");
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        throw IOError("Cannot create output directory " + out_dir.string() + ": " + ec.message());
    }

    const bool want_png = format == ExportFormat::PNG || format == ExportFormat::BOTH;
    const bool want_fits = format == ExportFormat::FITS || format == ExportFormat::BOTH;

    json files = json::array();
    for (const auto& item : pf.images) {
        const std::string& name = item.first;
        const Matrix2Dd& img = item.second;
        const std::string stem = prefix.empty() ? name : prefix + "_" + name;
        const json stats = stats_to_json(image::image_stats(img));

        auto record = [&](const fs::path& path, const char* kind) {
            json entry;
            entry["name"] = name;
            entry["format"] = kind;
            entry["file"] = path.filename().string();
            entry["sha256"] = core::sha256_file(path);
            entry["stats"] = stats;
            files.push_back(entry);
            if (on_written) {
                on_written(name, path);
            }
        };

        if (want_png) {
            const fs::path path = out_dir / (stem + ".png");
            io::write_png_image(path, img, pf.gray_scale);
            record(path, "png");
        }
        if (want_fits) {
            const fs::path path = out_dir / (stem + ".fits");
            io::write_fits_image(path, img, io::planform_header(pf, name));
            record(path, "fits");
        }
    }

    json manifest;
    manifest["params"] = params_to_json(pf);
    manifest["topology"] = topology_to_string(topology_from_count(pf.component_count));
    manifest["files"] = files;
    manifest["created"] = core::get_iso_timestamp();

    core::write_text(out_dir / "manifest.json", manifest.dump(2));
    return manifest;
}

} // namespace planform::runner
