#pragma once

#include "IconSpecs.hpp"
#include <opencv2/core.hpp>

namespace IconForge {

class CompositionEngine {
public:
    // Contain: min(T/w, T/h) * scale. Cover: max(T/w, T/h) * scale.
    static double fitScale(const cv::Size& content, const CompositionSpec& spec);

    /**
     * Center `content` on a transparent canvas, clipping whatever overflows.
     * Source and destination offsets are clamped at zero, so oversized content
     * is cropped symmetrically.
     */
    static cv::Mat placeCentered(const cv::Mat& content, int canvasSize);

    // Resample and center onto a targetSize x targetSize canvas
    static cv::Mat compose(const cv::Mat& rgba, const CompositionSpec& spec);

    /**
     * Enlarge `content` to scaledW x scaledH and center it on the canvas, rendering
     * only the canvas window. Working memory is bounded by the canvas no matter how
     * far the enlargement overflows it.
     */
    static cv::Mat renderVisible(const cv::Mat& content, double scaledW, double scaledH, int canvasSize);
};

} // namespace IconForge
