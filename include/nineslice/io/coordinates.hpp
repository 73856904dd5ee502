#pragma once

#include "nineslice/core/types.hpp"
#include "nineslice/geometry/slice_geometry.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace nineslice::io {

using json = nlohmann::json;

// Margins plus the nine source rectangles, as consumed by engine tooling.
struct CoordinateDescription {
    int image_width = 0;
    int image_height = 0;
    Margins margins;
    RegionArray regions;
};

CoordinateDescription describe(int width, int height, const Margins& margins,
                               const RegionArray& regions);
CoordinateDescription describe(const geometry::SliceGeometry& geometry);

// Field names and region keys are a compatibility surface; do not rename.
json to_json(const CoordinateDescription& desc);

// Throws ValidationError when a required field is missing or has the wrong type.
CoordinateDescription from_json(const json& j);

std::string dump_coordinates(const CoordinateDescription& desc, int indent = 2);

} // namespace nineslice::io
