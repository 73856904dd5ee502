#pragma once

#include "nineslice/core/types.hpp"

#include <opencv2/core.hpp>

namespace nineslice::test {

// Every pixel encodes its own coordinates so crops can be checked exactly.
inline Image make_coordinate_image(int width, int height) {
    Image img(height, width, kImageType);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            img.at<cv::Vec4b>(y, x) = cv::Vec4b(static_cast<uchar>(x % 256),
                                                static_cast<uchar>(y % 256),
                                                static_cast<uchar>((x + y) % 256), 255);
        }
    }
    return img;
}

inline cv::Vec4b coordinate_pixel(int x, int y) {
    return cv::Vec4b(static_cast<uchar>(x % 256), static_cast<uchar>(y % 256),
                     static_cast<uchar>((x + y) % 256), 255);
}

} // namespace nineslice::test
