#pragma once

#include "nineslice/core/types.hpp"
#include "nineslice/geometry/slice_geometry.hpp"
#include "nineslice/image/slice_extractor.hpp"

#include <array>

namespace nineslice::image {

struct AtlasCell {
    Region source;   // where the slice came from
    cv::Rect placed; // where it lands in the atlas
};

// 3x3 arrangement matching the region names. Column widths and row heights are
// the maxima over their three cells; padding surrounds every cell, including
// the outer border.
struct AtlasLayout {
    int padding = 0;
    std::array<int, 3> col_widths{0, 0, 0};
    std::array<int, 3> row_heights{0, 0, 0};
    std::array<int, 3> col_x{0, 0, 0};
    std::array<int, 3> row_y{0, 0, 0};
    int width = 0;
    int height = 0;
    std::array<AtlasCell, kRegionCount> cells;
};

struct Atlas {
    Image image;
    AtlasLayout layout;
};

// Throws InvalidPaddingError for padding < 0, or when the padded canvas would
// not fit in int.
AtlasLayout compute_atlas_layout(const RegionArray& regions, int padding);
AtlasLayout compute_atlas_layout(const geometry::SliceGeometry& geometry, int padding);

Atlas pack_atlas(const SliceSet& slices, int padding);

} // namespace nineslice::image
