#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>

namespace IconForge {

/**
 * Background removal by connectivity. Only pixels 4-connected to a border
 * seed through a chain of neighbors within `tolerance` become transparent,
 * so background-colored regions enclosed by the artwork survive.
 */
class BorderFloodMasker {
public:
    // Largest per-channel RGBA difference; two fully transparent pixels are equal
    static int colorDistance(const cv::Vec4b& a, const cv::Vec4b& b);

    // CV_8U mask, 255 on the background component reached from the seeds
    static cv::Mat backgroundMask(const cv::Mat& rgba, int tolerance, SeedMode seedMode);

    static cv::Mat floodFromEdges(const cv::Mat& rgba, int tolerance, SeedMode seedMode);

    // Flood with optional edge protection padding and trailing crop
    static cv::Mat apply(const cv::Mat& rgba, const BorderFloodMask& spec);
};

} // namespace IconForge
