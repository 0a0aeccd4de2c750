#pragma once

#include <opencv2/core.hpp>

namespace IconForge {

// Raster helpers shared by every stage. Images are CV_8UC4 in R,G,B,A order
// with straight (non-premultiplied) alpha.
class ImageOps {
public:
    static bool isRGBA(const cv::Mat& img);

    // 8-bit gray / RGB / RGBA -> new RGBA image (gray and RGB get alpha 255)
    static cv::Mat ensureRGBA(const cv::Mat& img);

    // OpenCV decode order (BGR/BGRA/gray) <-> internal RGBA
    static cv::Mat fromDecoded(const cv::Mat& decoded);
    static cv::Mat toEncodable(const cv::Mat& rgba);

    static cv::Mat extractAlpha(const cv::Mat& rgba);
    static cv::Mat replaceAlpha(const cv::Mat& rgba, const cv::Mat& alpha);

    static cv::Mat padTransparent(const cv::Mat& rgba, int border);

    /**
     * Resample in premultiplied space so transparent RGB never bleeds into
     * visible edges. Area filter when shrinking, Lanczos when enlarging.
     * Same-size requests return an exact copy.
     */
    static cv::Mat resizeRGBA(const cv::Mat& rgba, const cv::Size& size);
    static cv::Mat resizeRGBA(const cv::Mat& rgba, const cv::Size& size, int interpolation);
    static int chooseInterpolation(const cv::Size& from, const cv::Size& to);

    // CV_8UC4 straight -> CV_32FC4 premultiplied (alpha kept on the 0..255 scale)
    static cv::Mat premultiply(const cv::Mat& rgba);
    // Inverse of premultiply; fully transparent samples come back as (0,0,0,0)
    static cv::Mat unpremultiply(const cv::Mat& premultiplied);

    // Porter-Duff source-over: `top` painted over `bottom`
    static cv::Mat alphaComposite(const cv::Mat& bottom, const cv::Mat& top);

    // 1x256 CV_8U table: x<=lo -> 0, x>=hi -> 255, linear in between.
    // hi<=lo degenerates to a hard threshold (x>lo -> 255).
    static cv::Mat levelsLut(int lo, int hi);

    // Unsharp mask on every channel; samples move only where |src-blur| > threshold
    static cv::Mat unsharpMask(const cv::Mat& img, double radius, int percent, int threshold);
};

} // namespace IconForge
