#include "nineslice/config/configuration.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/core/utils.hpp"

#include <nlohmann/json.hpp>
#include <catch2/catch_test_macros.hpp>

using nineslice::config::Config;

TEST_CASE("config_defaults_are_valid") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.margins.use_defaults);
  REQUIRE(cfg.atlas.padding == 2);
  REQUIRE(cfg.output.coordinates_name == "slices.json");
}

TEST_CASE("config_from_yaml_reads_all_sections") {
  auto cfg = Config::from_yaml(YAML::Load(R"(
margins: {left: 10, top: 8, right: 12, bottom: 9}
atlas: {padding: 4}
output:
  stitched_name: c.png
  slices_dir: parts
  atlas_name: a.png
  coordinates_name: coords.json
  png_compression: 9
)"));

  REQUIRE_FALSE(cfg.margins.use_defaults);
  REQUIRE(cfg.margins.to_margins() == nineslice::Margins{10, 8, 12, 9});
  REQUIRE(cfg.atlas.padding == 4);
  REQUIRE(cfg.output.stitched_name == "c.png");
  REQUIRE(cfg.output.slices_dir == "parts");
  REQUIRE(cfg.output.atlas_name == "a.png");
  REQUIRE(cfg.output.coordinates_name == "coords.json");
  REQUIRE(cfg.output.png_compression == 9);
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_rejects_bad_values") {
  Config neg_padding;
  neg_padding.atlas.padding = -1;
  REQUIRE_THROWS_AS(neg_padding.validate(), nineslice::ValidationError);

  Config neg_margin;
  neg_margin.margins.use_defaults = false;
  neg_margin.margins.left = -3;
  REQUIRE_THROWS_AS(neg_margin.validate(), nineslice::ValidationError);

  Config compression;
  compression.output.png_compression = 10;
  REQUIRE_THROWS_AS(compression.validate(), nineslice::ValidationError);

  Config empty_name;
  empty_name.output.atlas_name.clear();
  REQUIRE_THROWS_AS(empty_name.validate(), nineslice::ValidationError);
}

TEST_CASE("config_wraps_type_errors") {
  REQUIRE_THROWS_AS(Config::from_yaml(YAML::Load("atlas: {padding: wide}")), nineslice::ConfigError);
}

TEST_CASE("config_load_missing_file_throws") {
  REQUIRE_THROWS_AS(Config::load("/nonexistent/nineslice.yaml"), nineslice::ConfigError);
}

TEST_CASE("config_save_and_load_round_trip") {
  auto path = nineslice::fs::temp_directory_path() /
              ("nineslice_cfg_" + nineslice::core::get_run_id() + ".yaml");

  Config cfg;
  cfg.margins.use_defaults = false;
  cfg.margins.left = 3;
  cfg.margins.bottom = 7;
  cfg.atlas.padding = 0;
  cfg.output.png_compression = 1;
  cfg.save(path);

  Config loaded = Config::load(path);
  nineslice::fs::remove(path);

  REQUIRE_FALSE(loaded.margins.use_defaults);
  REQUIRE(loaded.margins.to_margins() == nineslice::Margins{3, 0, 0, 7});
  REQUIRE(loaded.atlas.padding == 0);
  REQUIRE(loaded.output.png_compression == 1);
}

TEST_CASE("config_save_to_missing_directory_throws") {
  Config cfg;
  REQUIRE_THROWS_AS(cfg.save("/nonexistent/dir/nineslice.yaml"), nineslice::ConfigError);
}

TEST_CASE("config_schema_is_valid_json") {
  auto schema = nlohmann::json::parse(nineslice::config::get_schema_json());
  REQUIRE(schema["properties"].contains("atlas"));
  REQUIRE(schema["properties"]["output"]["properties"]["png_compression"]["maximum"] == 9);
}
