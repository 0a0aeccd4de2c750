#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>

namespace IconForge {

// Supersampled smoothing: 4x bicubic upscale, Gaussian melt, alpha levels, Lanczos downscale
class LiquidPolisher {
public:
    static constexpr int kSupersampleFactor = 4;
    static constexpr int kAlphaLow = 100;
    static constexpr int kAlphaHigh = 180;

    // Blur sigma at supersampled resolution: 2 + intensity * 8
    static double blurRadius(double intensity);

    static cv::Mat polish(const cv::Mat& rgba, double intensity);
    static cv::Mat apply(const cv::Mat& rgba, const LiquidPolishSpec& spec);
};

} // namespace IconForge
