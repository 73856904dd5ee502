#pragma once

#include "nineslice/core/types.hpp"

#include <cstdint>
#include <vector>

namespace nineslice::io {

bool is_supported_image_path(const fs::path& path);

// Load any format OpenCV reads and normalise it to 8-bit BGRA. Images without
// an alpha channel become fully opaque. Throws IOError on failure.
Image read_image_bgra(const fs::path& path);

Image to_bgra(const Image& img);

// Lossless PNG with alpha. compression is the zlib level, 0..9.
std::vector<uint8_t> encode_png(const Image& img, int compression = 3);

Image decode_image(const std::vector<uint8_t>& bytes);

// 1x1 fully transparent image, written in place of zero-area outputs.
Image transparent_placeholder();

} // namespace nineslice::io
