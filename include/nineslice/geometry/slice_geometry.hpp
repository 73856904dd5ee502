#pragma once

#include "nineslice/core/types.hpp"

namespace nineslice::geometry {

// Clamp a proposed margin into [0, extent - opposite].
int clamp_margin(int value, int opposite, int extent);

// Initial margins for a freshly loaded image: a quarter of each axis.
Margins default_margins(int width, int height);

struct MarginRatios {
    double left = 0.0;
    double top = 0.0;
    double right = 0.0;
    double bottom = 0.0;
};

// Image size plus four margins. The single source of truth for the slice grid;
// margins are always kept inside the valid range.
class SliceGeometry {
public:
    // Throws InvalidDimensionError for a non-positive width or height.
    // Out-of-range margins are clamped, in the order left, right, top, bottom.
    static SliceGeometry create(int width, int height, const Margins& requested);
    static SliceGeometry create(int width, int height, int left, int top, int right, int bottom);

    int width() const { return width_; }
    int height() const { return height_; }
    const Margins& margins() const { return margins_; }
    int margin(Side side) const;

    // Returns the value actually applied, which may differ from the request.
    int set_margin(Side side, int value);

    RegionArray regions() const;
    Region region(RegionName name) const;
    bool is_degenerate(RegionName name) const;

    MarginRatios margin_ratios() const;

private:
    SliceGeometry(int width, int height, const Margins& margins);

    int extent(Side side) const;

    int width_;
    int height_;
    Margins margins_;
};

} // namespace nineslice::geometry
