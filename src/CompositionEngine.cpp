#include "CompositionEngine.hpp"
#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace IconForge {

double CompositionEngine::fitScale(const Size& content, const CompositionSpec& spec) {
    const double target = static_cast<double>(spec.targetSize());
    const double sx = target / content.width;
    const double sy = target / content.height;
    const double base = spec.fitMode() == FitMode::Contain ? std::min(sx, sy) : std::max(sx, sy);
    return base * spec.scale();
}

Mat CompositionEngine::placeCentered(const Mat& content, int canvasSize) {
    Mat canvas(canvasSize, canvasSize, CV_8UC4, Scalar::all(0));

    const int offsetX = (canvasSize - content.cols) / 2;
    const int offsetY = (canvasSize - content.rows) / 2;

    const int srcX = std::max(0, -offsetX);
    const int srcY = std::max(0, -offsetY);
    const int dstX = std::max(0, offsetX);
    const int dstY = std::max(0, offsetY);
    const int copyW = std::min(content.cols - srcX, canvasSize - dstX);
    const int copyH = std::min(content.rows - srcY, canvasSize - dstY);

    if (copyW > 0 && copyH > 0) {
        content(Rect(srcX, srcY, copyW, copyH)).copyTo(canvas(Rect(dstX, dstY, copyW, copyH)));
    }
    return canvas;
}

Mat CompositionEngine::compose(const Mat& rgba, const CompositionSpec& spec) {
    const int target = spec.targetSize();
    if (rgba.empty()) {
        return Mat(target, target, CV_8UC4, Scalar::all(0));
    }

    Mat content = ImageOps::ensureRGBA(rgba);
    const double scale = fitScale(content.size(), spec);
    const double scaledW = std::max(1.0, std::round(content.cols * scale));
    const double scaledH = std::max(1.0, std::round(content.rows * scale));

    // Shrinking never needs more memory than the source; fitting content never more than the canvas
    if (scale < 1.0 || (scaledW <= target && scaledH <= target)) {
        Size scaled(static_cast<int>(scaledW), static_cast<int>(scaledH));
        return placeCentered(ImageOps::resizeRGBA(content, scaled), target);
    }
    return renderVisible(content, scaledW, scaledH, target);
}

Mat CompositionEngine::renderVisible(const Mat& content, double scaledW, double scaledH, int canvasSize) {
    // Same offsets placeCentered would use for the full-size enlargement
    const double offsetX = std::trunc((canvasSize - scaledW) / 2.0);
    const double offsetY = std::trunc((canvasSize - scaledH) / 2.0);
    const double ax = scaledW / content.cols;
    const double ay = scaledH / content.rows;

    // Pixel-center aligned mapping, matching cv::resize
    Mat transform = (Mat_<double>(2, 3) << ax, 0.0, 0.5 * ax - 0.5 + offsetX,
                                           0.0, ay, 0.5 * ay - 0.5 + offsetY);
    Mat warped;
    warpAffine(ImageOps::premultiply(content), warped, transform, Size(canvasSize, canvasSize),
               INTER_LANCZOS4, BORDER_REPLICATE);
    Mat visible = ImageOps::unpremultiply(warped);

    const int x0 = static_cast<int>(std::clamp(offsetX, 0.0, static_cast<double>(canvasSize)));
    const int y0 = static_cast<int>(std::clamp(offsetY, 0.0, static_cast<double>(canvasSize)));
    const int x1 = static_cast<int>(std::clamp(offsetX + scaledW, 0.0, static_cast<double>(canvasSize)));
    const int y1 = static_cast<int>(std::clamp(offsetY + scaledH, 0.0, static_cast<double>(canvasSize)));

    Mat canvas(canvasSize, canvasSize, CV_8UC4, Scalar::all(0));
    if (x1 > x0 && y1 > y0) {
        const Rect inside(x0, y0, x1 - x0, y1 - y0);
        visible(inside).copyTo(canvas(inside));
    }
    return canvas;
}

} // namespace IconForge
