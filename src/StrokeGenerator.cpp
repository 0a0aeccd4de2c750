#include "StrokeGenerator.hpp"
#include "AlphaMorphology.hpp"
#include "ImageOps.hpp"
#include <algorithm>

using namespace cv;

namespace IconForge {

Mat StrokeGenerator::strokeMask(const Mat& alpha, int width, StrokeAlignment alignment) {
    Mat outer;
    Mat inner;

    switch (alignment) {
        case StrokeAlignment::Outside:
            outer = AlphaMorphology::expandMask(alpha, width);
            inner = alpha;
            break;
        case StrokeAlignment::Inside:
            outer = alpha;
            inner = AlphaMorphology::chokeMask(alpha, width);
            break;
        case StrokeAlignment::Center: {
            const int half = std::max(1, width / 2);
            outer = AlphaMorphology::expandMask(alpha, half);
            inner = AlphaMorphology::chokeMask(alpha, half);
            break;
        }
    }

    // saturating subtract clamps at zero
    Mat band;
    subtract(outer, inner, band);
    return band;
}

Mat StrokeGenerator::applyStroke(const Mat& rgba, const RGBAColor& color, int width,
                                 StrokeAlignment alignment) {
    if (width <= 0 || !ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }

    Mat band = strokeMask(ImageOps::extractAlpha(rgba), width, alignment);
    if (color.a != 255) {
        band.convertTo(band, CV_8U, color.a / 255.0);
    }

    Mat layer(rgba.size(), CV_8UC4, Scalar(color.r, color.g, color.b, 0));
    insertChannel(band, layer, 3);

    if (alignment == StrokeAlignment::Outside) {
        return ImageOps::alphaComposite(layer, rgba);
    }
    return ImageOps::alphaComposite(rgba, layer);
}

Mat StrokeGenerator::apply(const Mat& rgba, const StrokeSpec& spec) {
    return applyStroke(rgba, spec.color(), spec.widthPx(), spec.alignment());
}

} // namespace IconForge
