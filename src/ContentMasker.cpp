#include "ContentMasker.hpp"
#include "AutoCropper.hpp"
#include "ImageOps.hpp"
#include <opencv2/core.hpp>
#include <algorithm>

using namespace cv;
using namespace std;

namespace IconForge {

Mat ContentMasker::keyMatches(const Mat& rgba, const vector<ColorKey>& keys) {
    Mat matches = Mat::zeros(rgba.size(), CV_8UC1);
    if (!ImageOps::isRGBA(rgba)) {
        return matches;
    }

    for (const ColorKey& key : keys) {
        const Color c = key.color();
        const int tol = key.tolerance();
        // inRange bounds are inclusive, which is exactly "max abs diff <= tolerance"
        Scalar lower(std::max(0, c.r - tol), std::max(0, c.g - tol), std::max(0, c.b - tol), 0);
        Scalar upper(std::min(255, c.r + tol), std::min(255, c.g + tol), std::min(255, c.b + tol), 255);

        Mat hit;
        inRange(rgba, lower, upper, hit);
        bitwise_or(matches, hit, matches);
    }
    return matches;
}

Mat ContentMasker::applyColorKeys(const Mat& rgba, const vector<ColorKey>& keys) {
    if (!ImageOps::isRGBA(rgba) || keys.empty()) {
        return rgba.clone();
    }

    Mat alpha = ImageOps::extractAlpha(rgba);
    alpha.setTo(0, keyMatches(rgba, keys));
    return ImageOps::replaceAlpha(rgba, alpha);
}

Mat ContentMasker::apply(const Mat& rgba, const ColorKeyMask& spec) {
    Mat masked = applyColorKeys(rgba, spec.keys());
    if (spec.autoCropAfter()) {
        masked = AutoCropper::cropToContent(masked, kAutoCropAfterPadding);
    }
    return masked;
}

} // namespace IconForge
