#pragma once

#include "nineslice/core/types.hpp"
#include "nineslice/export/artifact_writer.hpp"
#include "nineslice/geometry/slice_geometry.hpp"

#include <cstdint>
#include <vector>

namespace nineslice::exporting {

struct ExportOptions {
    int png_compression = 3;
};

struct ExportResult {
    ExportKind kind = ExportKind::STITCHED;
    std::vector<fs::path> files;
    int width = 0;   // stitched / atlas size; source size for coordinates
    int height = 0;
};

// Front-end entry point. Each call derives fresh images, encodes everything in
// memory, then hands the bytes to the writer. Writer failures surface as
// ExportIOError; nothing is retried.
class Exporter {
public:
    explicit Exporter(ArtifactWriter& writer, ExportOptions options = {});

    ExportResult export_stitched(const Image& image, const geometry::SliceGeometry& geometry,
                                 const fs::path& destination) const;

    // One "<region-name>.png" per region, in canonical order.
    ExportResult export_slices(const Image& image, const geometry::SliceGeometry& geometry,
                               const fs::path& destination_dir) const;

    ExportResult export_atlas(const Image& image, const geometry::SliceGeometry& geometry,
                              int padding, const fs::path& destination) const;

    ExportResult export_coordinates(const geometry::SliceGeometry& geometry,
                                    const fs::path& destination) const;

private:
    std::vector<uint8_t> encode(const Image& img) const;
    void write(ExportKind kind, const fs::path& destination,
               const std::vector<uint8_t>& bytes) const;

    ArtifactWriter& writer_;
    ExportOptions options_;
};

fs::path slice_file_name(RegionName name);

} // namespace nineslice::exporting
