#include "LiquidPolisher.hpp"
#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

using namespace cv;
using namespace std;

namespace IconForge {

double LiquidPolisher::blurRadius(double intensity) {
    return 2.0 + intensity * 8.0;
}

Mat LiquidPolisher::polish(const Mat& rgba, double intensity) {
    if (intensity <= 0.0 || !ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }

    const Size original = rgba.size();
    const Size big(original.width * kSupersampleFactor, original.height * kSupersampleFactor);

    Mat supersampled;
    resize(rgba, supersampled, big, 0, 0, INTER_CUBIC);

    Mat melted;
    GaussianBlur(supersampled, melted, Size(0, 0), blurRadius(intensity));

    // Harden alpha only; RGB stays as blurred
    vector<Mat> channels;
    split(melted, channels);
    LUT(channels[3], ImageOps::levelsLut(kAlphaLow, kAlphaHigh), channels[3]);
    merge(channels, melted);

    Mat result;
    resize(melted, result, original, 0, 0, INTER_LANCZOS4);
    return result;
}

Mat LiquidPolisher::apply(const Mat& rgba, const LiquidPolishSpec& spec) {
    return polish(rgba, spec.intensity());
}

} // namespace IconForge
