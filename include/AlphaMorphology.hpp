#pragma once

#include <opencv2/core.hpp>

namespace IconForge {

/**
 * Grow/shrink of an alpha plane. Every caller shares one structuring element:
 * the (2n+1)x(2n+1) square, so radius n reaches Chebyshev distance n.
 * Pixels outside the image never take part in the max/min.
 */
class AlphaMorphology {
public:
    static cv::Mat structuringElement(int radius);

    // Single-channel masks
    static cv::Mat expandMask(const cv::Mat& mask, int radius);
    static cv::Mat chokeMask(const cv::Mat& mask, int radius);

    // RGBA images: alpha plane only, RGB untouched
    static cv::Mat expand(const cv::Mat& rgba, int radius);
    static cv::Mat choke(const cv::Mat& rgba, int radius);

    // Signed shape weight: negative chokes, positive expands, zero copies
    static cv::Mat applyShapeWeight(const cv::Mat& rgba, int shapeWeight);
};

} // namespace IconForge
