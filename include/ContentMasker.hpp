#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>
#include <vector>

namespace IconForge {

// Chroma-key matting. Matching pixels lose their alpha but keep their RGB.
class ContentMasker {
public:
    // CV_8U mask, 255 where any key matches (max per-channel RGB diff <= tolerance)
    static cv::Mat keyMatches(const cv::Mat& rgba, const std::vector<ColorKey>& keys);

    static cv::Mat applyColorKeys(const cv::Mat& rgba, const std::vector<ColorKey>& keys);

    // Keys plus the optional crop that follows them
    static cv::Mat apply(const cv::Mat& rgba, const ColorKeyMask& spec);
};

} // namespace IconForge
