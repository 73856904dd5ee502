#pragma once

#include "nineslice/core/types.hpp"
#include "nineslice/image/slice_extractor.hpp"

namespace nineslice::image {

// Place the four corners at (0,0), (left,0), (0,top), (left,top) on a
// transparent (left+right) x (top+bottom) canvas. Degenerate corners shrink the
// canvas on their side and are never an error.
StitchedPreview stitch_corners(const CornerSlices& corners);

} // namespace nineslice::image
