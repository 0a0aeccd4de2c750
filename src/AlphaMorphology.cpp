#include "AlphaMorphology.hpp"
#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <cstdlib>

using namespace cv;

namespace IconForge {

Mat AlphaMorphology::structuringElement(int radius) {
    return getStructuringElement(MORPH_RECT, Size(2 * radius + 1, 2 * radius + 1));
}

Mat AlphaMorphology::expandMask(const Mat& mask, int radius) {
    if (mask.empty() || radius <= 0) {
        return mask.clone();
    }
    Mat grown;
    // Default border value for dilate is -inf, so the outside never wins the max
    dilate(mask, grown, structuringElement(radius), Point(-1, -1), 1,
           BORDER_CONSTANT, morphologyDefaultBorderValue());
    return grown;
}

Mat AlphaMorphology::chokeMask(const Mat& mask, int radius) {
    if (mask.empty() || radius <= 0) {
        return mask.clone();
    }
    Mat shrunk;
    erode(mask, shrunk, structuringElement(radius), Point(-1, -1), 1,
          BORDER_CONSTANT, morphologyDefaultBorderValue());
    return shrunk;
}

Mat AlphaMorphology::expand(const Mat& rgba, int radius) {
    if (!ImageOps::isRGBA(rgba) || radius <= 0) {
        return rgba.clone();
    }
    return ImageOps::replaceAlpha(rgba, expandMask(ImageOps::extractAlpha(rgba), radius));
}

Mat AlphaMorphology::choke(const Mat& rgba, int radius) {
    if (!ImageOps::isRGBA(rgba) || radius <= 0) {
        return rgba.clone();
    }
    return ImageOps::replaceAlpha(rgba, chokeMask(ImageOps::extractAlpha(rgba), radius));
}

Mat AlphaMorphology::applyShapeWeight(const Mat& rgba, int shapeWeight) {
    if (shapeWeight < 0) {
        return choke(rgba, std::abs(shapeWeight));
    }
    return expand(rgba, shapeWeight);
}

} // namespace IconForge
