#include "nineslice/core/events.hpp"
#include "nineslice/core/utils.hpp"
#include "nineslice/io/image_io.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

TEST_CASE("sha256_of_empty_input_is_known_digest") {
  REQUIRE(nineslice::core::sha256_bytes({}) ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("iso_timestamp_is_utc_with_millis") {
  auto ts = nineslice::core::get_iso_timestamp();
  REQUIRE(ts.size() == 24);
  REQUIRE(ts[10] == 'T');
  REQUIRE(ts.back() == 'Z');
}

TEST_CASE("event_emitter_writes_one_json_object_per_line") {
  nineslice::core::EventEmitter events;
  std::ostringstream out;

  events.export_start("run1", nineslice::ExportKind::ATLAS, "out/atlas.png", out);
  events.export_end("run1", nineslice::ExportKind::ATLAS, "ok", {{"width", 108}}, out);

  std::istringstream lines(out.str());
  std::string line;
  REQUIRE(std::getline(lines, line));
  auto start = nlohmann::json::parse(line);
  REQUIRE(start["type"] == "export_start");
  REQUIRE(start["export"] == "atlas");
  REQUIRE(start["destination"] == "out/atlas.png");
  REQUIRE(std::getline(lines, line));
  auto end = nlohmann::json::parse(line);
  REQUIRE(end["type"] == "export_end");
  REQUIRE(end["width"] == 108);
  REQUIRE(end["run_id"] == "run1");
}

TEST_CASE("to_bgra_adds_opaque_alpha") {
  cv::Mat gray(2, 3, CV_8UC1, cv::Scalar(42));
  auto out = nineslice::io::to_bgra(gray);
  REQUIRE(out.type() == nineslice::kImageType);
  REQUIRE(out.at<cv::Vec4b>(1, 2) == cv::Vec4b(42, 42, 42, 255));

  cv::Mat bgr(1, 1, CV_8UC3, cv::Scalar(1, 2, 3));
  REQUIRE(nineslice::io::to_bgra(bgr).at<cv::Vec4b>(0, 0) == cv::Vec4b(1, 2, 3, 255));
}

TEST_CASE("supported_image_paths_are_case_insensitive") {
  REQUIRE(nineslice::io::is_supported_image_path("Panel.PNG"));
  REQUIRE(nineslice::io::is_supported_image_path("button.tga"));
  REQUIRE_FALSE(nineslice::io::is_supported_image_path("slices.json"));
}
