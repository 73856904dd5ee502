#pragma once

#include "nineslice/core/types.hpp"
#include "nineslice/geometry/slice_geometry.hpp"

namespace nineslice::image {

struct Slice {
    Region region;
    Image pixels;  // empty for a degenerate region
};

struct CornerSlices {
    Slice top_left;
    Slice top_right;
    Slice bottom_left;
    Slice bottom_right;
};

// Throws ValidationError unless img is a non-empty CV_8UC4 matrix.
void require_source_image(const Image& img);

// Deep copy of the pixels inside region. Degenerate regions give an empty
// CV_8UC4 matrix. Throws ValidationError if the region leaves the image.
Image extract_region(const Image& img, const Region& region);

// On-demand mapping from region name to slice. Holds a read-only header of the
// source and a snapshot of the grid; pixels are copied only when asked for.
class SliceSet {
public:
    SliceSet(const Image& source, const RegionArray& regions);

    const RegionArray& regions() const { return regions_; }
    const std::array<RegionName, kRegionCount>& names() const { return kRegionOrder; }

    Slice at(RegionName name) const;
    CornerSlices corners() const;

private:
    Image source_;
    RegionArray regions_;
};

SliceSet extract_all(const Image& img, const geometry::SliceGeometry& geometry);

} // namespace nineslice::image
