#include "nineslice/io/coordinates.hpp"
#include "nineslice/core/errors.hpp"

namespace nineslice::io {

namespace {

int require_int(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw ValidationError(where + "." + key + " is missing");
    }
    const json& v = obj.at(key);
    if (!v.is_number_integer()) {
        throw ValidationError(where + "." + key + " must be an integer");
    }
    return v.get<int>();
}

const json& require_object(const json& obj, const std::string& key, const std::string& where) {
    if (!obj.is_object() || !obj.contains(key) || !obj.at(key).is_object()) {
        throw ValidationError(where + "." + key + " must be an object");
    }
    return obj.at(key);
}

} // namespace

CoordinateDescription describe(int width, int height, const Margins& margins,
                               const RegionArray& regions) {
    CoordinateDescription desc;
    desc.image_width = width;
    desc.image_height = height;
    desc.margins = margins;
    desc.regions = regions;
    return desc;
}

CoordinateDescription describe(const geometry::SliceGeometry& geometry) {
    return describe(geometry.width(), geometry.height(), geometry.margins(),
                    geometry.regions());
}

json to_json(const CoordinateDescription& desc) {
    json j;
    j["image_width"] = desc.image_width;
    j["image_height"] = desc.image_height;
    j["margins"] = {
        {"left", desc.margins.left},
        {"top", desc.margins.top},
        {"right", desc.margins.right},
        {"bottom", desc.margins.bottom}
    };

    // Same fractions the editor shows beside its preview.
    const double w = desc.image_width > 0 ? static_cast<double>(desc.image_width) : 1.0;
    const double h = desc.image_height > 0 ? static_cast<double>(desc.image_height) : 1.0;
    j["margin_ratios"] = {
        {"left", desc.margins.left / w},
        {"top", desc.margins.top / h},
        {"right", desc.margins.right / w},
        {"bottom", desc.margins.bottom / h}
    };

    json regions = json::object();
    for (const Region& r : desc.regions) {
        regions[region_name_to_string(r.name)] = {
            {"x", r.x},
            {"y", r.y},
            {"width", r.width},
            {"height", r.height}
        };
    }
    j["regions"] = regions;
    return j;
}

CoordinateDescription from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("coordinate description must be a JSON object");
    }

    CoordinateDescription desc;
    desc.image_width = require_int(j, "image_width", "$");
    desc.image_height = require_int(j, "image_height", "$");

    const json& m = require_object(j, "margins", "$");
    desc.margins.left = require_int(m, "left", "$.margins");
    desc.margins.top = require_int(m, "top", "$.margins");
    desc.margins.right = require_int(m, "right", "$.margins");
    desc.margins.bottom = require_int(m, "bottom", "$.margins");

    const json& regions = require_object(j, "regions", "$");
    for (RegionName name : kRegionOrder) {
        const std::string key = region_name_to_string(name);
        const json& r = require_object(regions, key, "$.regions");
        const std::string where = "$.regions." + key;
        Region& out = desc.regions[static_cast<size_t>(region_index(name))];
        out.name = name;
        out.x = require_int(r, "x", where);
        out.y = require_int(r, "y", where);
        out.width = require_int(r, "width", where);
        out.height = require_int(r, "height", where);
    }
    return desc;
}

std::string dump_coordinates(const CoordinateDescription& desc, int indent) {
    return to_json(desc).dump(indent);
}

} // namespace nineslice::io
