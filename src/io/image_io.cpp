#include "nineslice/io/image_io.hpp"
#include "nineslice/core/errors.hpp"
#include "nineslice/core/utils.hpp"

#include <opencv2/opencv.hpp>

#include <array>

namespace nineslice::io {

bool is_supported_image_path(const fs::path& path) {
    static const std::array<const char*, 9> exts = {
        ".png", ".jpg", ".jpeg", ".bmp", ".gif", ".tga", ".tif", ".tiff", ".webp"
    };
    const std::string name = core::to_lower(path.filename().string());
    for (const char* ext : exts) {
        if (core::ends_with(name, ext)) {
            return true;
        }
    }
    return false;
}

Image to_bgra(const Image& img) {
    if (img.empty()) {
        throw IOError("Cannot convert an empty image");
    }

    Image depth8;
    switch (img.depth()) {
        case CV_8U:
            depth8 = img;
            break;
        case CV_16U:
            img.convertTo(depth8, CV_8U, 1.0 / 257.0);
            break;
        case CV_32F:
        case CV_64F:
            img.convertTo(depth8, CV_8U, 255.0);
            break;
        default:
            throw IOError("Unsupported pixel depth: " + std::to_string(img.depth()));
    }

    Image out;
    switch (depth8.channels()) {
        case 1:
            cv::cvtColor(depth8, out, cv::COLOR_GRAY2BGRA);
            break;
        case 3:
            cv::cvtColor(depth8, out, cv::COLOR_BGR2BGRA);
            break;
        case 4:
            out = depth8.clone();
            break;
        default:
            throw IOError("Unsupported channel count: " + std::to_string(depth8.channels()));
    }
    return out;
}

Image read_image_bgra(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("Image not found: " + path.string());
    }
    Image raw = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    return to_bgra(raw);
}

std::vector<uint8_t> encode_png(const Image& img, int compression) {
    if (img.empty()) {
        throw IOError("Cannot encode an empty image");
    }
    std::vector<int> params = {cv::IMWRITE_PNG_COMPRESSION, compression};
    std::vector<uchar> buf;
    if (!cv::imencode(".png", img, buf, params)) {
        throw IOError("PNG encoding failed");
    }
    return std::vector<uint8_t>(buf.begin(), buf.end());
}

Image decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw IOError("Cannot decode an empty buffer");
    }
    Image raw = cv::imdecode(cv::Mat(1, static_cast<int>(bytes.size()), CV_8U,
                                     const_cast<uint8_t*>(bytes.data())),
                             cv::IMREAD_UNCHANGED);
    if (raw.empty()) {
        throw IOError("Cannot decode image buffer");
    }
    return raw;
}

Image transparent_placeholder() {
    return Image(1, 1, kImageType, cv::Scalar(0, 0, 0, 0));
}

} // namespace nineslice::io
