#include "nineslice/image/atlas_packer.hpp"
#include "nineslice/core/errors.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace nineslice::image {

AtlasLayout compute_atlas_layout(const RegionArray& regions, int padding) {
    if (padding < 0) {
        throw InvalidPaddingError(padding);
    }

    AtlasLayout layout;
    layout.padding = padding;

    for (const Region& r : regions) {
        const int row = region_row(r.name);
        const int col = region_col(r.name);
        layout.col_widths[col] = std::max(layout.col_widths[col], std::max(r.width, 0));
        layout.row_heights[row] = std::max(layout.row_heights[row], std::max(r.height, 0));
    }

    // Summed in 64 bits; a canvas side must still fit in int.
    int64_t x = padding;
    int64_t y = padding;
    for (int i = 0; i < 3; ++i) {
        layout.col_x[i] = static_cast<int>(x);
        layout.row_y[i] = static_cast<int>(y);
        x += static_cast<int64_t>(layout.col_widths[i]) + padding;
        y += static_cast<int64_t>(layout.row_heights[i]) + padding;
        if (x > std::numeric_limits<int>::max() || y > std::numeric_limits<int>::max()) {
            throw InvalidPaddingError(padding);
        }
    }
    layout.width = static_cast<int>(x);
    layout.height = static_cast<int>(y);

    for (const Region& r : regions) {
        const int idx = region_index(r.name);
        AtlasCell& cell = layout.cells[static_cast<size_t>(idx)];
        cell.source = r;
        cell.placed = cv::Rect(layout.col_x[region_col(r.name)],
                               layout.row_y[region_row(r.name)],
                               std::max(r.width, 0), std::max(r.height, 0));
    }
    return layout;
}

AtlasLayout compute_atlas_layout(const geometry::SliceGeometry& geometry, int padding) {
    return compute_atlas_layout(geometry.regions(), padding);
}

Atlas pack_atlas(const SliceSet& slices, int padding) {
    Atlas atlas;
    atlas.layout = compute_atlas_layout(slices.regions(), padding);

    atlas.image = Image(atlas.layout.height, atlas.layout.width, kImageType,
                        cv::Scalar(0, 0, 0, 0));

    for (RegionName name : slices.names()) {
        const AtlasCell& cell = atlas.layout.cells[static_cast<size_t>(region_index(name))];
        if (cell.source.is_degenerate()) {
            continue;
        }
        Slice s = slices.at(name);
        s.pixels.copyTo(atlas.image(cell.placed));
    }
    return atlas;
}

} // namespace nineslice::image
