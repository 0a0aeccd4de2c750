#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>

namespace IconForge {

/**
 * Colored outline derived from the alpha boundary.
 *
 *   Outside: expand(M, w) - M,            stroke painted behind the image
 *   Inside:  M - choke(M, w),             stroke painted over the image
 *   Center:  expand(M, w/2) - choke(M, w/2), stroke painted over the image
 */
class StrokeGenerator {
public:
    // Per-pixel max(0, outer - inner) for the given alignment
    static cv::Mat strokeMask(const cv::Mat& alpha, int width, StrokeAlignment alignment);

    // Width <= 0 or a non-RGBA input returns the input unchanged
    static cv::Mat applyStroke(const cv::Mat& rgba, const RGBAColor& color, int width,
                               StrokeAlignment alignment);

    static cv::Mat apply(const cv::Mat& rgba, const StrokeSpec& spec);
};

} // namespace IconForge
