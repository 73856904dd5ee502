#pragma once

#include <opencv2/core.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <string>

namespace nineslice {

namespace fs = std::filesystem;

// Pixel buffer. Sources and every derived image are CV_8UC4 (BGRA).
using Image = cv::Mat;

inline constexpr int kImageType = CV_8UC4;

// Pixel distances from each edge inward to the nearest slice line.
struct Margins {
    int left = 0;
    int top = 0;
    int right = 0;
    int bottom = 0;
};

inline bool operator==(const Margins& a, const Margins& b) {
    return a.left == b.left && a.top == b.top && a.right == b.right &&
           a.bottom == b.bottom;
}

inline bool operator!=(const Margins& a, const Margins& b) {
    return !(a == b);
}

enum class Side {
    LEFT,
    TOP,
    RIGHT,
    BOTTOM
};

inline Side opposite_side(Side side) {
    switch (side) {
        case Side::LEFT: return Side::RIGHT;
        case Side::RIGHT: return Side::LEFT;
        case Side::TOP: return Side::BOTTOM;
        default: return Side::TOP;
    }
}

// Region names in canonical row-major order. The string forms are keyed on by
// downstream tooling and must not change.
enum class RegionName {
    TOP_LEFT = 0,
    TOP_CENTER = 1,
    TOP_RIGHT = 2,
    MID_LEFT = 3,
    CENTER = 4,
    MID_RIGHT = 5,
    BOTTOM_LEFT = 6,
    BOTTOM_CENTER = 7,
    BOTTOM_RIGHT = 8
};

inline constexpr int kRegionCount = 9;

inline constexpr std::array<RegionName, kRegionCount> kRegionOrder = {
    RegionName::TOP_LEFT,    RegionName::TOP_CENTER,    RegionName::TOP_RIGHT,
    RegionName::MID_LEFT,    RegionName::CENTER,        RegionName::MID_RIGHT,
    RegionName::BOTTOM_LEFT, RegionName::BOTTOM_CENTER, RegionName::BOTTOM_RIGHT
};

inline std::string region_name_to_string(RegionName name) {
    switch (name) {
        case RegionName::TOP_LEFT: return "top-left";
        case RegionName::TOP_CENTER: return "top-center";
        case RegionName::TOP_RIGHT: return "top-right";
        case RegionName::MID_LEFT: return "mid-left";
        case RegionName::CENTER: return "center";
        case RegionName::MID_RIGHT: return "mid-right";
        case RegionName::BOTTOM_LEFT: return "bottom-left";
        case RegionName::BOTTOM_CENTER: return "bottom-center";
        case RegionName::BOTTOM_RIGHT: return "bottom-right";
        default: return "unknown";
    }
}

inline std::optional<RegionName> string_to_region_name(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (RegionName name : kRegionOrder) {
        if (region_name_to_string(name) == norm) {
            return name;
        }
    }
    return std::nullopt;
}

inline int region_index(RegionName name) {
    return static_cast<int>(name);
}

inline int region_row(RegionName name) {
    return region_index(name) / 3;
}

inline int region_col(RegionName name) {
    return region_index(name) % 3;
}

// Rectangle of one slice in source pixel space.
struct Region {
    RegionName name = RegionName::CENTER;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool is_degenerate() const { return width <= 0 || height <= 0; }
    int area() const { return is_degenerate() ? 0 : width * height; }
};

inline bool operator==(const Region& a, const Region& b) {
    return a.name == b.name && a.x == b.x && a.y == b.y && a.width == b.width &&
           a.height == b.height;
}

inline bool operator!=(const Region& a, const Region& b) {
    return !(a == b);
}

using RegionArray = std::array<Region, kRegionCount>;

// Four corners stitched together with the center gap removed.
struct StitchedPreview {
    Image image;     // empty when width or height is zero
    int width = 0;   // left + right
    int height = 0;  // top + bottom
};

// Export operations offered to the front end.
enum class ExportKind {
    STITCHED = 0,
    SLICES = 1,
    ATLAS = 2,
    COORDINATES = 3
};

inline std::string export_kind_to_string(ExportKind kind) {
    switch (kind) {
        case ExportKind::STITCHED: return "stitched";
        case ExportKind::SLICES: return "slices";
        case ExportKind::ATLAS: return "atlas";
        case ExportKind::COORDINATES: return "coordinates";
        default: return "unknown";
    }
}

} // namespace nineslice
