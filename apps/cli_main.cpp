#include "nineslice/core/errors.hpp"
#include "nineslice/core/events.hpp"
#include "nineslice/core/types.hpp"
#include "nineslice/core/utils.hpp"
#include "nineslice/config/configuration.hpp"
#include "nineslice/export/exporter.hpp"
#include "nineslice/geometry/slice_geometry.hpp"
#include "nineslice/image/atlas_packer.hpp"
#include "nineslice/io/coordinates.hpp"
#include "nineslice/io/image_io.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

using nineslice::ExportKind;
using nineslice::Margins;
using nineslice::config::Config;
using nineslice::geometry::SliceGeometry;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

struct MarginOverrides {
    std::optional<int> left;
    std::optional<int> top;
    std::optional<int> right;
    std::optional<int> bottom;
};

static Config load_config_or_default(const std::string& config_path) {
    Config cfg;
    if (!config_path.empty()) {
        cfg = Config::load(config_path);
    }
    cfg.validate();
    return cfg;
}

// Config margins (or the 25 % defaults) with command-line overrides on top.
// Out-of-range values are clamped by the geometry, never rejected.
static SliceGeometry build_geometry(const nineslice::Image& img, const Config& cfg,
                                    const MarginOverrides& ov) {
    Margins m = cfg.margins.use_defaults
        ? nineslice::geometry::default_margins(img.cols, img.rows)
        : cfg.margins.to_margins();
    if (ov.left) m.left = *ov.left;
    if (ov.top) m.top = *ov.top;
    if (ov.right) m.right = *ov.right;
    if (ov.bottom) m.bottom = *ov.bottom;
    return SliceGeometry::create(img.cols, img.rows, m);
}

static json margins_to_json(const Margins& m) {
    return {{"left", m.left}, {"top", m.top}, {"right", m.right}, {"bottom", m.bottom}};
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    std::cout << nineslice::config::get_schema_json() << std::endl;
    return 0;
}

// ============================================================================
// validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin,
                        bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        Config cfg;
        if (!path.empty()) {
            cfg = Config::load(path);
        } else {
            const std::string yaml_text = use_stdin ? read_stdin() : yaml_arg;
            cfg = Config::from_yaml(YAML::Load(yaml_text));
        }
        cfg.validate();
        result["valid"] = true;
    } catch (const nineslice::NineSliceError& e) {
        result["errors"].push_back(e.what());
    } catch (const YAML::Exception& e) {
        result["errors"].push_back(std::string("Config error: ") + e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// info <image>
// ============================================================================
int cmd_info(const std::string& image_path) {
    nineslice::Image img = nineslice::io::read_image_bgra(image_path);
    Margins defaults = nineslice::geometry::default_margins(img.cols, img.rows);

    json result;
    result["path"] = image_path;
    result["width"] = img.cols;
    result["height"] = img.rows;
    result["default_margins"] = margins_to_json(defaults);
    print_json(result);
    return 0;
}

// ============================================================================
// describe <image> [--config F] [--left N --top N --right N --bottom N] [--region R]
// ============================================================================
int cmd_describe(const std::string& image_path, const std::string& config_path,
                 const MarginOverrides& ov, const std::string& region_name) {
    Config cfg = load_config_or_default(config_path);
    nineslice::Image img = nineslice::io::read_image_bgra(image_path);
    SliceGeometry geometry = build_geometry(img, cfg, ov);

    if (region_name.empty()) {
        std::cout << nineslice::io::dump_coordinates(nineslice::io::describe(geometry)) << std::endl;
        return 0;
    }

    auto name = nineslice::string_to_region_name(region_name);
    if (!name) {
        throw nineslice::ValidationError("unknown region: " + region_name);
    }
    nineslice::Region r = geometry.region(*name);
    print_json({{"name", nineslice::region_name_to_string(r.name)},
                {"x", r.x},
                {"y", r.y},
                {"width", r.width},
                {"height", r.height},
                {"degenerate", r.is_degenerate()}});
    return 0;
}

// ============================================================================
// layout <image> [--config F] [margins] [--padding N]
// ============================================================================
int cmd_layout(const std::string& image_path, const std::string& config_path,
               const MarginOverrides& ov, std::optional<int> padding) {
    Config cfg = load_config_or_default(config_path);
    nineslice::Image img = nineslice::io::read_image_bgra(image_path);
    SliceGeometry geometry = build_geometry(img, cfg, ov);

    auto layout = nineslice::image::compute_atlas_layout(geometry, padding.value_or(cfg.atlas.padding));

    json result;
    result["width"] = layout.width;
    result["height"] = layout.height;
    result["padding"] = layout.padding;
    result["col_widths"] = layout.col_widths;
    result["row_heights"] = layout.row_heights;
    result["cells"] = json::object();
    for (const auto& cell : layout.cells) {
        result["cells"][nineslice::region_name_to_string(cell.source.name)] = {
            {"x", cell.placed.x},
            {"y", cell.placed.y},
            {"width", cell.placed.width},
            {"height", cell.placed.height}
        };
    }
    print_json(result);
    return 0;
}

// ============================================================================
// export <image> --out DIR [--config F] [margins] [--padding N]
//        [--stitched] [--slices] [--atlas] [--coords]
// ============================================================================
int cmd_export(const std::string& image_path, const std::string& out_dir,
               const std::string& config_path, const MarginOverrides& ov,
               std::optional<int> padding, std::set<ExportKind> kinds) {
    nineslice::core::EventEmitter events;
    const std::string run_id = nineslice::core::get_run_id();

    if (kinds.empty()) {
        kinds = {ExportKind::STITCHED, ExportKind::SLICES, ExportKind::ATLAS,
                 ExportKind::COORDINATES};
    }

    try {
        Config cfg = load_config_or_default(config_path);
        nineslice::Image img = nineslice::io::read_image_bgra(image_path);
        SliceGeometry geometry = build_geometry(img, cfg, ov);
        const int atlas_padding = padding.value_or(cfg.atlas.padding);

        events.run_start(run_id, {{"image", image_path},
                                  {"out", out_dir},
                                  {"width", img.cols},
                                  {"height", img.rows},
                                  {"margins", margins_to_json(geometry.margins())}},
                         std::cout);
        if (!nineslice::io::is_supported_image_path(image_path)) {
            events.warning(run_id, "unrecognised image extension: " + image_path, std::cout);
        }

        nineslice::exporting::FileArtifactWriter writer;
        nineslice::exporting::ExportOptions options;
        options.png_compression = cfg.output.png_compression;
        nineslice::exporting::Exporter exporter(writer, options);

        const fs::path out(out_dir);
        json summary;
        summary["run_id"] = run_id;
        summary["files"] = json::array();

        for (ExportKind kind : kinds) {
            nineslice::exporting::ExportResult res;
            fs::path dest;
            switch (kind) {
                case ExportKind::STITCHED:
                    dest = out / cfg.output.stitched_name;
                    events.export_start(run_id, kind, dest, std::cout);
                    res = exporter.export_stitched(img, geometry, dest);
                    if (res.width == 0 || res.height == 0) {
                        events.warning(run_id, "stitched corners are empty; wrote a transparent placeholder",
                                       std::cout);
                    }
                    break;
                case ExportKind::SLICES:
                    dest = out / cfg.output.slices_dir;
                    events.export_start(run_id, kind, dest, std::cout);
                    res = exporter.export_slices(img, geometry, dest);
                    break;
                case ExportKind::ATLAS:
                    dest = out / cfg.output.atlas_name;
                    events.export_start(run_id, kind, dest, std::cout);
                    res = exporter.export_atlas(img, geometry, atlas_padding, dest);
                    break;
                case ExportKind::COORDINATES:
                    dest = out / cfg.output.coordinates_name;
                    events.export_start(run_id, kind, dest, std::cout);
                    res = exporter.export_coordinates(geometry, dest);
                    break;
            }

            json files = json::array();
            for (const auto& f : res.files) {
                json entry = {{"path", f.string()},
                              {"export", nineslice::export_kind_to_string(kind)},
                              {"sha256", nineslice::core::sha256_file(f)}};
                files.push_back(entry["path"]);
                summary["files"].push_back(entry);
            }
            events.export_end(run_id, kind, "ok",
                              {{"width", res.width}, {"height", res.height}, {"files", files}},
                              std::cout);
        }

        events.run_end(run_id, true, "ok", std::cout);
        print_json(summary);
        return 0;
    } catch (const nineslice::NineSliceError& e) {
        events.error(run_id, e.what(), std::cout);
        events.run_end(run_id, false, "error", std::cout);
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        events.error(run_id, e.what(), std::cout);
        events.run_end(run_id, false, "error", std::cout);
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: nineslice_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config (--path P | --yaml Y | --stdin)  Validate config\n"
              << "  info <image>                    Print image size and default margins\n"
              << "  describe <image> [opts] [--region R]  Print the coordinate description\n"
              << "  layout <image> [opts]           Print the atlas layout without rendering\n"
              << "  export <image> --out DIR [opts] [--stitched] [--slices] [--atlas] [--coords]\n"
              << "\nOptions:\n"
              << "  --config F                      YAML config file\n"
              << "  --left N --top N --right N --bottom N  Margin overrides (clamped)\n"
              << "  --padding N                     Atlas padding in pixels\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    static const std::set<std::string> value_options = {
        "--config", "--out", "--left", "--top", "--right", "--bottom",
        "--padding", "--path", "--yaml", "--region"
    };

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (value_options.count(argv[i]) && i + 1 < argc) {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    auto get_int_arg = [&](const char* name) -> std::optional<int> {
        std::string v = get_arg(name);
        if (v.empty()) return std::nullopt;
        return std::stoi(v);
    };

    try {
        if (command == "get-schema") {
            return cmd_get_schema();
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            std::string yaml = get_arg("--yaml");
            bool use_stdin = has_flag("--stdin");
            bool strict = has_flag("--strict-exit-codes");

            if (path.empty() && yaml.empty() && !use_stdin) {
                std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
                return 1;
            }
            return cmd_validate_config(path, yaml, use_stdin, strict);
        }

        MarginOverrides ov;
        ov.left = get_int_arg("--left");
        ov.top = get_int_arg("--top");
        ov.right = get_int_arg("--right");
        ov.bottom = get_int_arg("--bottom");

        if (command == "info") {
            std::string image_path = get_positional(0);
            if (image_path.empty()) {
                std::cerr << "info requires an image argument\n";
                return 1;
            }
            return cmd_info(image_path);
        }

        if (command == "describe") {
            std::string image_path = get_positional(0);
            if (image_path.empty()) {
                std::cerr << "describe requires an image argument\n";
                return 1;
            }
            return cmd_describe(image_path, get_arg("--config"), ov, get_arg("--region"));
        }

        if (command == "layout") {
            std::string image_path = get_positional(0);
            if (image_path.empty()) {
                std::cerr << "layout requires an image argument\n";
                return 1;
            }
            return cmd_layout(image_path, get_arg("--config"), ov, get_int_arg("--padding"));
        }

        if (command == "export") {
            std::string image_path = get_positional(0);
            std::string out_dir = get_arg("--out");
            if (image_path.empty() || out_dir.empty()) {
                std::cerr << "export requires an image argument and --out DIR\n";
                return 1;
            }
            std::set<ExportKind> kinds;
            if (has_flag("--stitched")) kinds.insert(ExportKind::STITCHED);
            if (has_flag("--slices")) kinds.insert(ExportKind::SLICES);
            if (has_flag("--atlas")) kinds.insert(ExportKind::ATLAS);
            if (has_flag("--coords")) kinds.insert(ExportKind::COORDINATES);
            return cmd_export(image_path, out_dir, get_arg("--config"), ov,
                              get_int_arg("--padding"), kinds);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "Numeric argument out of range: " << e.what() << std::endl;
        return 1;
    } catch (const nineslice::NineSliceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
