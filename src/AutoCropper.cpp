#include "AutoCropper.hpp"
#include "ImageOps.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using namespace cv;
using namespace std;

namespace IconForge {

optional<Rect> AutoCropper::contentBounds(const Mat& rgba) {
    if (!ImageOps::isRGBA(rgba)) {
        return nullopt;
    }

    Mat alpha = ImageOps::extractAlpha(rgba);
    vector<Point> visible;
    findNonZero(alpha, visible);
    if (visible.empty()) {
        return nullopt;
    }
    return boundingRect(visible);
}

Mat AutoCropper::cropToContent(const Mat& rgba, int padding) {
    if (padding < 0) {
        throw invalid_argument("Crop padding cannot be negative, got " + to_string(padding));
    }

    optional<Rect> bounds = contentBounds(rgba);
    if (!bounds) {
        return rgba.clone();
    }
    return ImageOps::padTransparent(rgba(*bounds), padding);
}

} // namespace IconForge
