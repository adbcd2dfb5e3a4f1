#include "planform/config/configuration.hpp"
#include "planform/config/resolver.hpp"
#include "planform/core/errors.hpp"
#include "planform/core/events.hpp"
#include "planform/core/utils.hpp"
#include "planform/runner/manifest.hpp"
#include "planform/synthesis/generator.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;
using json = nlohmann::json;

using planform::config::Planform;
using planform::config::PlanformParams;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static PlanformParams load_params(const std::string& config_path) {
    if (config_path.empty()) {
        return PlanformParams{};
    }
    if (config_path == "-") {
        return PlanformParams::load(std::cin);
    }
    return PlanformParams::load(fs::path(config_path));
}

// Resolves with notices on stdout and returns how many defaults were used.
static Planform resolve_with_count(const PlanformParams& params, int& defaults_assigned) {
    defaults_assigned = 0;
    auto to_stdout = planform::config::stdout_notices();
    return planform::config::resolve(params, [&](const std::string& line) {
        ++defaults_assigned;
        to_stdout(line);
    });
}

// ============================================================================
// generate --out-dir <dir> [--config <file|->] [--format png|fits|both]
// ============================================================================
int cmd_generate(const std::string& config_path, const std::string& out_dir,
                 const std::string& format_arg, const std::string& prefix) {
    const fs::path out(out_dir);
    std::error_code ec;
    fs::create_directories(out, ec);
    if (ec) {
        std::cerr << "[PF] Cannot create output directory " << out << ": " << ec.message()
                  << std::endl;
        return 1;
    }

    std::ofstream log_file(out / "events.jsonl", std::ios::app);
    if (!log_file) {
        std::cerr << "[PF] Cannot open " << (out / "events.jsonl") << std::endl;
        return 1;
    }

    planform::core::EventEmitter events;
    const std::string run_id = planform::core::get_run_id();
    events.run_start(run_id, {{"config", config_path.empty() ? "<defaults>" : config_path},
                              {"out_dir", out.string()},
                              {"format", format_arg}}, log_file);

    try {
        const auto format = planform::runner::parse_export_format(format_arg);

        int defaults_assigned = 0;
        Planform pf = resolve_with_count(load_params(config_path), defaults_assigned);
        pf.validate();
        if (config_path.empty()) {
            events.warning(run_id, "no --config given, using built-in defaults", log_file);
        }
        events.resolve_end(run_id, planform::runner::params_to_json(pf), defaults_assigned,
                           log_file);

        planform::synthesis::generate_inplace(pf);
        events.generate_end(run_id,
                            planform::topology_from_count(pf.component_count),
                            static_cast<int>(pf.images.size()), log_file);

        planform::runner::export_images(pf, out, format, prefix,
            [&](const std::string& name, const fs::path& path) {
                events.image_written(run_id, name, path.string(), log_file);
            });
    } catch (const planform::PlanformError& e) {
        std::cerr << "[PF] " << e.what() << std::endl;
        events.error(run_id, e.what(), log_file);
        events.run_end(run_id, false, "error", log_file);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[PF] Unexpected failure: " << e.what() << std::endl;
        events.error(run_id, std::string("unexpected: ") + e.what(), log_file);
        events.run_end(run_id, false, "error", log_file);
        return 1;
    }

    events.run_end(run_id, true, "ok", log_file);
    std::cerr << "[PF] Wrote images to " << out.string() << std::endl;
    return 0;
}

// ============================================================================
// stats [--config <file|->]
// ============================================================================
int cmd_stats(const std::string& config_path) {
    try {
        Planform pf = planform::config::resolve(load_params(config_path),
                                                planform::config::silent_notices());
        pf.validate();
        planform::synthesis::generate_inplace(pf);

        json result;
        result["params"] = planform::runner::params_to_json(pf);
        result["images"] = planform::runner::stats_report(pf);
        print_json(result);
    } catch (const planform::PlanformError& e) {
        std::cerr << "[PF] " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[PF] Unexpected failure: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

// ============================================================================
// defaults
// ============================================================================
int cmd_defaults() {
    print_json(planform::runner::defaults_to_json(planform::config::default_params()));
    return 0;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << planform::config::get_schema_json() << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"Planform stimulus generator"};
    app.require_subcommand(1);

    std::string config_path;
    std::string out_dir;
    std::string format = "png";
    std::string prefix = "planform";

    auto generate_cmd = app.add_subcommand("generate", "Generate planform images");
    generate_cmd->add_option("--config", config_path,
                             "Planform YAML (omit for defaults, '-' for stdin)");
    generate_cmd->add_option("--out-dir", out_dir, "Output directory")->required();
    generate_cmd->add_option("--format", format, "png | fits | both")
        ->default_val("png");
    generate_cmd->add_option("--prefix", prefix, "File name prefix")
        ->default_val("planform");

    auto stats_cmd = app.add_subcommand("stats", "Print per-image statistics as JSON");
    stats_cmd->add_option("--config", config_path,
                          "Planform YAML (omit for defaults, '-' for stdin)");

    auto defaults_cmd = app.add_subcommand("defaults", "Print default parameters as JSON");
    auto schema_cmd = app.add_subcommand("get-schema", "Print the config JSON schema");

    CLI11_PARSE(app, argc, argv);

    if (generate_cmd->parsed()) {
        return cmd_generate(config_path, out_dir, format, prefix);
    }
    if (stats_cmd->parsed()) {
        return cmd_stats(config_path);
    }
    if (defaults_cmd->parsed()) {
        return cmd_defaults();
    }
    if (schema_cmd->parsed()) {
        return cmd_get_schema();
    }
    return 1;
}
