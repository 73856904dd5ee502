#include "nineslice/geometry/slice_geometry.hpp"
#include "nineslice/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace nineslice::geometry {

int clamp_margin(int value, int opposite, int extent) {
    const int upper = std::max(0, extent - std::max(0, opposite));
    return std::min(std::max(value, 0), upper);
}

Margins default_margins(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw InvalidDimensionError(width, height);
    }
    // nearbyint rounds half to even under the default rounding mode.
    const int h = static_cast<int>(std::nearbyint(static_cast<double>(width) * 0.25));
    const int v = static_cast<int>(std::nearbyint(static_cast<double>(height) * 0.25));
    return Margins{h, v, h, v};
}

SliceGeometry::SliceGeometry(int width, int height, const Margins& margins)
    : width_(width), height_(height), margins_(margins) {}

SliceGeometry SliceGeometry::create(int width, int height, const Margins& requested) {
    if (width <= 0 || height <= 0) {
        throw InvalidDimensionError(width, height);
    }

    Margins m;
    m.left = clamp_margin(requested.left, 0, width);
    m.right = clamp_margin(requested.right, m.left, width);
    m.top = clamp_margin(requested.top, 0, height);
    m.bottom = clamp_margin(requested.bottom, m.top, height);
    return SliceGeometry(width, height, m);
}

SliceGeometry SliceGeometry::create(int width, int height, int left, int top,
                                    int right, int bottom) {
    return create(width, height, Margins{left, top, right, bottom});
}

int SliceGeometry::extent(Side side) const {
    return (side == Side::LEFT || side == Side::RIGHT) ? width_ : height_;
}

int SliceGeometry::margin(Side side) const {
    switch (side) {
        case Side::LEFT: return margins_.left;
        case Side::TOP: return margins_.top;
        case Side::RIGHT: return margins_.right;
        case Side::BOTTOM: return margins_.bottom;
    }
    return 0;
}

int SliceGeometry::set_margin(Side side, int value) {
    const int applied = clamp_margin(value, margin(opposite_side(side)), extent(side));
    switch (side) {
        case Side::LEFT: margins_.left = applied; break;
        case Side::TOP: margins_.top = applied; break;
        case Side::RIGHT: margins_.right = applied; break;
        case Side::BOTTOM: margins_.bottom = applied; break;
    }
    return applied;
}

RegionArray SliceGeometry::regions() const {
    const int xs[4] = {0, margins_.left, width_ - margins_.right, width_};
    const int ys[4] = {0, margins_.top, height_ - margins_.bottom, height_};

    RegionArray out;
    for (RegionName name : kRegionOrder) {
        const int row = region_row(name);
        const int col = region_col(name);
        Region r;
        r.name = name;
        r.x = xs[col];
        r.y = ys[row];
        r.width = xs[col + 1] - xs[col];
        r.height = ys[row + 1] - ys[row];
        out[static_cast<size_t>(region_index(name))] = r;
    }
    return out;
}

Region SliceGeometry::region(RegionName name) const {
    return regions()[static_cast<size_t>(region_index(name))];
}

bool SliceGeometry::is_degenerate(RegionName name) const {
    return region(name).is_degenerate();
}

MarginRatios SliceGeometry::margin_ratios() const {
    const double w = static_cast<double>(width_);
    const double h = static_cast<double>(height_);
    return MarginRatios{margins_.left / w, margins_.top / h,
                        margins_.right / w, margins_.bottom / h};
}

} // namespace nineslice::geometry
