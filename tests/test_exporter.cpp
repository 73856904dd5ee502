#include "nineslice/export/exporter.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/core/utils.hpp"
#include "nineslice/io/coordinates.hpp"
#include "nineslice/io/image_io.hpp"
#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <stdexcept>

using nineslice::ExportKind;
using nineslice::Image;
using nineslice::fs::path;
using nineslice::exporting::ArtifactWriter;
using nineslice::exporting::Exporter;
using nineslice::geometry::SliceGeometry;
using nineslice::test::coordinate_pixel;
using nineslice::test::make_coordinate_image;

namespace {

class MemoryWriter : public ArtifactWriter {
public:
  void write(const path& destination, const std::vector<uint8_t>& bytes) override {
    files[destination] = bytes;
  }

  std::map<path, std::vector<uint8_t>> files;
};

class FailingWriter : public ArtifactWriter {
public:
  void write(const path&, const std::vector<uint8_t>&) override {
    throw std::runtime_error("disk full");
  }
};

// Scratch directory removed when the test ends.
struct TempDir {
  TempDir() : dir(nineslice::fs::temp_directory_path() / ("nineslice_test_" + nineslice::core::get_run_id())) {
    nineslice::fs::create_directories(dir);
  }
  ~TempDir() {
    std::error_code ec;
    nineslice::fs::remove_all(dir, ec);
  }
  path dir;
};

} // namespace

TEST_CASE("export_stitched_writes_png_of_margin_sums") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(100, 80);

  auto res = exporter.export_stitched(img, SliceGeometry::create(100, 80, 10, 15, 20, 25), "out/corners.png");

  REQUIRE(res.kind == ExportKind::STITCHED);
  REQUIRE(res.width == 30);
  REQUIRE(res.height == 40);
  REQUIRE(res.files == std::vector<path>{"out/corners.png"});
  Image decoded = nineslice::io::decode_image(writer.files.at("out/corners.png"));
  REQUIRE(decoded.cols == 30);
  REQUIRE(decoded.rows == 40);
  REQUIRE(decoded.channels() == 4);
  REQUIRE(decoded.at<cv::Vec4b>(0, 0) == coordinate_pixel(0, 0));
}

TEST_CASE("export_stitched_zero_margins_writes_transparent_placeholder") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(10, 10);

  auto res = exporter.export_stitched(img, SliceGeometry::create(10, 10, 0, 0, 0, 0), "c.png");

  REQUIRE(res.width == 0);
  REQUIRE(res.height == 0);
  Image decoded = nineslice::io::decode_image(writer.files.at("c.png"));
  REQUIRE(decoded.cols == 1);
  REQUIRE(decoded.rows == 1);
  REQUIRE(decoded.at<cv::Vec4b>(0, 0)[3] == 0);
}

TEST_CASE("export_slices_writes_nine_named_pngs") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(100, 80);
  auto g = SliceGeometry::create(100, 80, 10, 8, 12, 9);

  auto res = exporter.export_slices(img, g, "slices");

  REQUIRE(res.files.size() == 9);
  REQUIRE(res.files.front() == path("slices") / "top-left.png");
  REQUIRE(res.files.back() == path("slices") / "bottom-right.png");
  REQUIRE(writer.files.size() == 9);
  Image center = nineslice::io::decode_image(writer.files.at(path("slices") / "center.png"));
  REQUIRE(center.cols == 78);
  REQUIRE(center.rows == 63);
}

TEST_CASE("export_atlas_reports_padded_size") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(100, 80);

  auto res = exporter.export_atlas(img, SliceGeometry::create(100, 80, 10, 8, 12, 9), 2, "atlas.png");

  REQUIRE(res.width == 108);
  REQUIRE(res.height == 88);
  Image decoded = nineslice::io::decode_image(writer.files.at("atlas.png"));
  REQUIRE(decoded.cols == 108);
  REQUIRE(decoded.at<cv::Vec4b>(0, 0)[3] == 0);
}

TEST_CASE("export_atlas_rejects_negative_padding_before_writing") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(10, 10);

  REQUIRE_THROWS_AS(exporter.export_atlas(img, SliceGeometry::create(10, 10, 1, 1, 1, 1), -2, "a.png"),
                    nineslice::InvalidPaddingError);
  REQUIRE(writer.files.empty());
}

TEST_CASE("export_atlas_rejects_oversized_padding_before_writing") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(100, 80);

  REQUIRE_THROWS_AS(exporter.export_atlas(img, SliceGeometry::create(100, 80, 10, 8, 12, 9),
                                          600000000, "a.png"),
                    nineslice::InvalidPaddingError);
  REQUIRE(writer.files.empty());
}

TEST_CASE("export_atlas_is_byte_identical_across_calls") {
  MemoryWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(50, 30);
  auto g = SliceGeometry::create(50, 30, 4, 6, 8, 3);

  exporter.export_atlas(img, g, 3, "a.png");
  exporter.export_atlas(img, g, 3, "b.png");

  REQUIRE(writer.files.at("a.png") == writer.files.at("b.png"));
}

TEST_CASE("export_coordinates_writes_json_document") {
  MemoryWriter writer;
  Exporter exporter(writer);
  auto g = SliceGeometry::create(100, 80, 10, 8, 12, 9);

  exporter.export_coordinates(g, "slices.json");

  const auto& bytes = writer.files.at("slices.json");
  auto j = nineslice::io::json::parse(std::string(bytes.begin(), bytes.end()));
  auto parsed = nineslice::io::from_json(j);
  REQUIRE(parsed.regions == g.regions());
}

TEST_CASE("writer_failure_surfaces_as_export_io_error") {
  FailingWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(10, 10);

  try {
    exporter.export_atlas(img, SliceGeometry::create(10, 10, 2, 2, 2, 2), 1, "atlas.png");
    FAIL("expected ExportIOError");
  } catch (const nineslice::ExportIOError& e) {
    REQUIRE(e.export_kind() == "atlas");
    REQUIRE(e.destination() == path("atlas.png"));
  }
}

TEST_CASE("failed_atlas_export_leaves_prior_slices_untouched") {
  TempDir tmp;
  Image img = make_coordinate_image(40, 40);
  auto g = SliceGeometry::create(40, 40, 5, 5, 5, 5);

  nineslice::exporting::FileArtifactWriter file_writer;
  Exporter good(file_writer);
  auto res = good.export_slices(img, g, tmp.dir / "slices");

  std::map<path, std::string> before;
  for (const auto& f : res.files) {
    before[f] = nineslice::core::sha256_file(f);
  }

  FailingWriter failing;
  Exporter bad(failing);
  REQUIRE_THROWS_AS(bad.export_atlas(img, g, 2, tmp.dir / "slices" / "atlas.png"),
                    nineslice::ExportIOError);

  for (const auto& [f, digest] : before) {
    REQUIRE(nineslice::core::sha256_file(f) == digest);
  }
  REQUIRE_FALSE(nineslice::fs::exists(tmp.dir / "slices" / "atlas.png"));
}

TEST_CASE("file_writer_reports_unwritable_destination") {
  TempDir tmp;
  // A regular file standing where a directory is needed.
  nineslice::core::write_text(tmp.dir / "blocker", "x");

  nineslice::exporting::FileArtifactWriter writer;
  Exporter exporter(writer);
  Image img = make_coordinate_image(10, 10);

  REQUIRE_THROWS_AS(exporter.export_slices(img, SliceGeometry::create(10, 10, 2, 2, 2, 2),
                                           tmp.dir / "blocker" / "slices"),
                    nineslice::ExportIOError);
}

TEST_CASE("exporter_rejects_invalid_compression") {
  MemoryWriter writer;
  nineslice::exporting::ExportOptions options;
  options.png_compression = 12;
  REQUIRE_THROWS_AS(Exporter(writer, options), nineslice::ValidationError);
}
