#pragma once

#include <opencv2/core.hpp>
#include <optional>

namespace IconForge {

class AutoCropper {
public:
    // Tight box around every pixel with alpha > 0; nullopt when nothing is visible
    static std::optional<cv::Rect> contentBounds(const cv::Mat& rgba);

    /**
     * Crop to the visible content and re-pad with `padding` transparent pixels
     * on each side. Images with no visible pixel come back unchanged, so the
     * result is never zero-area. Idempotent for a fixed padding.
     */
    static cv::Mat cropToContent(const cv::Mat& rgba, int padding);
};

} // namespace IconForge
