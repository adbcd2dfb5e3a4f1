#pragma once

#include "planform/config/configuration.hpp"
#include "planform/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <functional>
#include <string>

namespace fs = std::filesystem;

namespace planform::runner {

enum class ExportFormat {
    PNG,
    FITS,
    BOTH
};

/**
 * Parse "png" | "fits" | "both" (case-insensitive). Throws ValidationError.
 */
ExportFormat parse_export_format(const std::string& s);

/**
 * Resolved user-facing parameters plus cycles_per_pixel.
 */
nlohmann::json params_to_json(const config::Planform& pf);

nlohmann::json defaults_to_json(const config::PlanformDefaults& d);

nlohmann::json stats_to_json(const ImageStats& s);

/**
 * Per-image statistics of pf.images keyed by image name.
 */
nlohmann::json stats_report(const config::Planform& pf);

// Called once per file written.
using ImageWrittenCallback = std::function<void(const std::string& name, const fs::path& path)>;

/**
 * Writes every image in pf.images as <prefix>_<name>.<ext> into out_dir and
 * a manifest.json (params, per-file sha256 and stats). Returns the manifest.
 */
nlohmann::json export_images(const config::Planform& pf,
                             const fs::path& out_dir,
                             ExportFormat format,
                             const std::string& prefix,
                             const ImageWrittenCallback& on_written = {});

} // namespace planform::runner
