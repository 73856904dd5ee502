#include "nineslice/image/corner_stitcher.hpp"
#include "nineslice/core/errors.hpp"

#include <opencv2/opencv.hpp>

namespace nineslice::image {

namespace {

void paste(Image& canvas, const Slice& s, int x, int y) {
    if (s.region.is_degenerate() || s.pixels.empty()) {
        return;
    }
    if (s.pixels.cols != s.region.width || s.pixels.rows != s.region.height) {
        throw ValidationError("slice " + region_name_to_string(s.region.name) +
                              " pixels do not match its region");
    }
    if (x + s.pixels.cols > canvas.cols || y + s.pixels.rows > canvas.rows) {
        throw ValidationError("corner " + region_name_to_string(s.region.name) +
                              " does not fit the stitched canvas");
    }
    s.pixels.copyTo(canvas(cv::Rect(x, y, s.pixels.cols, s.pixels.rows)));
}

} // namespace

StitchedPreview stitch_corners(const CornerSlices& corners) {
    // Sizes come from the regions, not the pixel buffers: a zero-width corner
    // still carries its height for the other side of the canvas.
    const int left = corners.top_left.region.width;
    const int top = corners.top_left.region.height;
    const int right = corners.top_right.region.width;
    const int bottom = corners.bottom_left.region.height;

    StitchedPreview out;
    out.width = left + right;
    out.height = top + bottom;
    if (out.width <= 0 || out.height <= 0) {
        out.image = Image(0, 0, kImageType);
        return out;
    }

    out.image = Image(out.height, out.width, kImageType, cv::Scalar(0, 0, 0, 0));
    paste(out.image, corners.top_left, 0, 0);
    paste(out.image, corners.top_right, left, 0);
    paste(out.image, corners.bottom_left, 0, top);
    paste(out.image, corners.bottom_right, left, top);
    return out;
}

} // namespace nineslice::image
