#include "EdgeRefiner.hpp"
#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>

using namespace cv;

namespace IconForge {

namespace {

Mat blurAndRemapAlpha(const Mat& rgba, double blurRadius, const Mat& lut) {
    Mat alpha = ImageOps::extractAlpha(rgba);
    if (blurRadius > 0.0) {
        GaussianBlur(alpha, alpha, Size(0, 0), blurRadius);
    }
    LUT(alpha, lut, alpha);
    return ImageOps::replaceAlpha(rgba, alpha);
}

} // namespace

Mat EdgeRefiner::cleanEdges(const Mat& rgba, int threshold, double blurRadius) {
    if (!ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }
    const int hi = std::min(255, threshold + kDebrisRampWidth);
    return blurAndRemapAlpha(rgba, blurRadius, ImageOps::levelsLut(threshold, hi));
}

Mat EdgeRefiner::roundCorners(const Mat& rgba, double blurRadius) {
    if (!ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }
    // hi == lo gives a hard cut: alpha >= kRoundingThreshold survives
    const int cut = kRoundingThreshold - 1;
    return blurAndRemapAlpha(rgba, blurRadius, ImageOps::levelsLut(cut, cut));
}

Mat EdgeRefiner::applyCornerSharpness(const Mat& rgba, int cornerSharpness) {
    if (cornerSharpness < kNeutralSharpness) {
        double radius = (kNeutralSharpness - cornerSharpness) / 10.0;
        return roundCorners(rgba, radius);
    }
    if (cornerSharpness > kNeutralSharpness) {
        int amount = (cornerSharpness - kNeutralSharpness) * 2;
        return ImageOps::unsharpMask(rgba, 2.0, amount * 2, 3);
    }
    return rgba.clone();
}

Mat EdgeRefiner::applyResolutionSnap(const Mat& rgba, int resolutionSnap) {
    if (resolutionSnap <= 0) {
        return rgba.clone();
    }
    return ImageOps::unsharpMask(rgba, 1.0, static_cast<int>(resolutionSnap * 1.5), 3);
}

Mat EdgeRefiner::refine(const Mat& rgba, const EdgeRefineSpec& spec) {
    Mat refined = cleanEdges(rgba, spec.debrisThreshold(), spec.smoothBlurRadius());
    refined = applyCornerSharpness(refined, spec.cornerSharpness());
    return applyResolutionSnap(refined, spec.resolutionSnap());
}

} // namespace IconForge
