#include "nineslice/export/exporter.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/image/atlas_packer.hpp"
#include "nineslice/image/corner_stitcher.hpp"
#include "nineslice/image/slice_extractor.hpp"
#include "nineslice/io/coordinates.hpp"
#include "nineslice/io/image_io.hpp"

#include <utility>

namespace nineslice::exporting {

fs::path slice_file_name(RegionName name) {
    return fs::path(region_name_to_string(name) + ".png");
}

Exporter::Exporter(ArtifactWriter& writer, ExportOptions options)
    : writer_(writer), options_(options) {
    if (options_.png_compression < 0 || options_.png_compression > 9) {
        throw ValidationError("png_compression must be in [0,9]");
    }
}

std::vector<uint8_t> Exporter::encode(const Image& img) const {
    if (img.empty()) {
        return io::encode_png(io::transparent_placeholder(), options_.png_compression);
    }
    return io::encode_png(img, options_.png_compression);
}

void Exporter::write(ExportKind kind, const fs::path& destination,
                     const std::vector<uint8_t>& bytes) const {
    try {
        writer_.write(destination, bytes);
    } catch (const ExportIOError&) {
        throw;
    } catch (const std::exception& e) {
        throw ExportIOError(export_kind_to_string(kind), destination, e.what());
    }
}

ExportResult Exporter::export_stitched(const Image& image,
                                       const geometry::SliceGeometry& geometry,
                                       const fs::path& destination) const {
    image::SliceSet slices = image::extract_all(image, geometry);
    StitchedPreview preview = image::stitch_corners(slices.corners());

    const std::vector<uint8_t> bytes = encode(preview.image);
    write(ExportKind::STITCHED, destination, bytes);

    ExportResult result;
    result.kind = ExportKind::STITCHED;
    result.files.push_back(destination);
    result.width = preview.width;
    result.height = preview.height;
    return result;
}

ExportResult Exporter::export_slices(const Image& image,
                                     const geometry::SliceGeometry& geometry,
                                     const fs::path& destination_dir) const {
    image::SliceSet slices = image::extract_all(image, geometry);

    std::vector<std::pair<fs::path, std::vector<uint8_t>>> encoded;
    encoded.reserve(kRegionCount);
    for (RegionName name : slices.names()) {
        encoded.emplace_back(destination_dir / slice_file_name(name),
                             encode(slices.at(name).pixels));
    }

    ExportResult result;
    result.kind = ExportKind::SLICES;
    result.width = geometry.width();
    result.height = geometry.height();
    for (const auto& [path, bytes] : encoded) {
        write(ExportKind::SLICES, path, bytes);
        result.files.push_back(path);
    }
    return result;
}

ExportResult Exporter::export_atlas(const Image& image,
                                    const geometry::SliceGeometry& geometry, int padding,
                                    const fs::path& destination) const {
    if (padding < 0) {
        throw InvalidPaddingError(padding);
    }
    image::SliceSet slices = image::extract_all(image, geometry);
    image::Atlas atlas = image::pack_atlas(slices, padding);

    const std::vector<uint8_t> bytes = encode(atlas.image);
    write(ExportKind::ATLAS, destination, bytes);

    ExportResult result;
    result.kind = ExportKind::ATLAS;
    result.files.push_back(destination);
    result.width = atlas.layout.width;
    result.height = atlas.layout.height;
    return result;
}

ExportResult Exporter::export_coordinates(const geometry::SliceGeometry& geometry,
                                          const fs::path& destination) const {
    const std::string text = io::dump_coordinates(io::describe(geometry)) + "\n";
    write(ExportKind::COORDINATES, destination,
          std::vector<uint8_t>(text.begin(), text.end()));

    ExportResult result;
    result.kind = ExportKind::COORDINATES;
    result.files.push_back(destination);
    result.width = geometry.width();
    result.height = geometry.height();
    return result;
}

} // namespace nineslice::exporting
