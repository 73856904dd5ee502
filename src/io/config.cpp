#include "nineslice/config/configuration.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/core/utils.hpp"

#include <string>

namespace nineslice::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["margins"]) {
            auto m = node["margins"];
            if (m["left"] || m["top"] || m["right"] || m["bottom"]) {
                cfg.margins.use_defaults = false;
            }
            if (m["left"]) cfg.margins.left = m["left"].as<int>();
            if (m["top"]) cfg.margins.top = m["top"].as<int>();
            if (m["right"]) cfg.margins.right = m["right"].as<int>();
            if (m["bottom"]) cfg.margins.bottom = m["bottom"].as<int>();
        }

        if (node["atlas"]) {
            auto a = node["atlas"];
            if (a["padding"]) cfg.atlas.padding = a["padding"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["stitched_name"]) cfg.output.stitched_name = o["stitched_name"].as<std::string>();
            if (o["slices_dir"]) cfg.output.slices_dir = o["slices_dir"].as<std::string>();
            if (o["atlas_name"]) cfg.output.atlas_name = o["atlas_name"].as<std::string>();
            if (o["coordinates_name"]) cfg.output.coordinates_name = o["coordinates_name"].as<std::string>();
            if (o["png_compression"]) cfg.output.png_compression = o["png_compression"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << to_yaml();
    try {
        core::write_text(path, std::string(out.c_str()) + "\n");
    } catch (const IOError& e) {
        throw ConfigError("Cannot write config file: " + path.string() + " (" + e.what() + ")");
    }
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    if (!margins.use_defaults) {
        node["margins"]["left"] = margins.left;
        node["margins"]["top"] = margins.top;
        node["margins"]["right"] = margins.right;
        node["margins"]["bottom"] = margins.bottom;
    }

    node["atlas"]["padding"] = atlas.padding;

    node["output"]["stitched_name"] = output.stitched_name;
    node["output"]["slices_dir"] = output.slices_dir;
    node["output"]["atlas_name"] = output.atlas_name;
    node["output"]["coordinates_name"] = output.coordinates_name;
    node["output"]["png_compression"] = output.png_compression;

    return node;
}

void Config::validate() const {
    if (!margins.use_defaults) {
        if (margins.left < 0 || margins.top < 0 || margins.right < 0 || margins.bottom < 0) {
            throw ValidationError("margins.* must be >= 0");
        }
    }

    if (atlas.padding < 0) {
        throw ValidationError("atlas.padding must be >= 0");
    }

    if (output.stitched_name.empty()) {
        throw ValidationError("output.stitched_name must not be empty");
    }
    if (output.slices_dir.empty()) {
        throw ValidationError("output.slices_dir must not be empty");
    }
    if (output.atlas_name.empty()) {
        throw ValidationError("output.atlas_name must not be empty");
    }
    if (output.coordinates_name.empty()) {
        throw ValidationError("output.coordinates_name must not be empty");
    }
    if (output.png_compression < 0 || output.png_compression > 9) {
        throw ValidationError("output.png_compression must be in [0,9]");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "margins": {
      "type": "object",
      "properties": {
        "left": {"type": "integer", "minimum": 0},
        "top": {"type": "integer", "minimum": 0},
        "right": {"type": "integer", "minimum": 0},
        "bottom": {"type": "integer", "minimum": 0}
      }
    },
    "atlas": {
      "type": "object",
      "properties": {
        "padding": {"type": "integer", "minimum": 0}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "stitched_name": {"type": "string", "minLength": 1},
        "slices_dir": {"type": "string", "minLength": 1},
        "atlas_name": {"type": "string", "minLength": 1},
        "coordinates_name": {"type": "string", "minLength": 1},
        "png_compression": {"type": "integer", "minimum": 0, "maximum": 9}
      }
    }
  }
})";
}

} // namespace nineslice::config
