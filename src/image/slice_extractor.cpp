#include "nineslice/image/slice_extractor.hpp"
#include "nineslice/core/errors.hpp"

#include <opencv2/opencv.hpp>

namespace nineslice::image {

void require_source_image(const Image& img) {
    if (img.empty()) {
        throw ValidationError("source image is empty");
    }
    if (img.type() != kImageType) {
        throw ValidationError("source image must be 8-bit BGRA, got " +
                              std::to_string(img.channels()) + " channel(s)");
    }
}

Image extract_region(const Image& img, const Region& region) {
    if (region.is_degenerate()) {
        return Image(0, 0, kImageType);
    }
    if (region.x < 0 || region.y < 0 ||
        region.x + region.width > img.cols ||
        region.y + region.height > img.rows) {
        throw ValidationError("region " + region_name_to_string(region.name) +
                              " lies outside the " + std::to_string(img.cols) + "x" +
                              std::to_string(img.rows) + " image");
    }
    return img(cv::Rect(region.x, region.y, region.width, region.height)).clone();
}

SliceSet::SliceSet(const Image& source, const RegionArray& regions)
    : source_(source), regions_(regions) {}

Slice SliceSet::at(RegionName name) const {
    const Region& r = regions_[static_cast<size_t>(region_index(name))];
    return Slice{r, extract_region(source_, r)};
}

CornerSlices SliceSet::corners() const {
    return CornerSlices{
        at(RegionName::TOP_LEFT),
        at(RegionName::TOP_RIGHT),
        at(RegionName::BOTTOM_LEFT),
        at(RegionName::BOTTOM_RIGHT)
    };
}

SliceSet extract_all(const Image& img, const geometry::SliceGeometry& geometry) {
    require_source_image(img);
    if (img.cols != geometry.width() || img.rows != geometry.height()) {
        throw ValidationError("geometry is " + std::to_string(geometry.width()) + "x" +
                              std::to_string(geometry.height()) + " but image is " +
                              std::to_string(img.cols) + "x" + std::to_string(img.rows));
    }
    return SliceSet(img, geometry.regions());
}

} // namespace nineslice::image
