#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>

namespace IconForge {

class EdgeRefiner {
public:
    static constexpr int kNeutralSharpness = 50;
    static constexpr int kRoundingThreshold = 128;
    static constexpr int kDebrisRampWidth = 80;

    /**
     * Blur the alpha plane by `blurRadius` (sigma, skipped when <= 0) and remap
     * it with levels lo=threshold, hi=min(255, threshold+80). Faint debris at or
     * below the threshold drops to zero, alpha just above it stays faint, and
     * everything from threshold+80 up becomes fully opaque.
     */
    static cv::Mat cleanEdges(const cv::Mat& rgba, int threshold, double blurRadius);

    // Alpha blur followed by a hard cut: alpha >= 128 -> 255, else 0
    static cv::Mat roundCorners(const cv::Mat& rgba, double blurRadius);

    // < 50 rounds corners (sigma (50-v)/10), > 50 unsharp-masks the image
    static cv::Mat applyCornerSharpness(const cv::Mat& rgba, int cornerSharpness);

    // Final pixel-grid crispness pass; 0 is a no-op
    static cv::Mat applyResolutionSnap(const cv::Mat& rgba, int resolutionSnap);

    static cv::Mat refine(const cv::Mat& rgba, const EdgeRefineSpec& spec);
};

} // namespace IconForge
