#pragma once

#include "nineslice/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace nineslice::config {

namespace fs = std::filesystem;

struct MarginsConfig {
  bool use_defaults = true; // false once the file names any margin
  int left = 0;
  int top = 0;
  int right = 0;
  int bottom = 0;

  Margins to_margins() const { return Margins{left, top, right, bottom}; }
};

struct AtlasConfig {
  int padding = 2;
};

struct OutputConfig {
  std::string stitched_name = "corners.png";
  std::string slices_dir = "slices";
  std::string atlas_name = "atlas.png";
  std::string coordinates_name = "slices.json";
  int png_compression = 3; // zlib level 0..9
};

struct Config {
  MarginsConfig margins;
  AtlasConfig atlas;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

std::string get_schema_json();

} // namespace nineslice::config
