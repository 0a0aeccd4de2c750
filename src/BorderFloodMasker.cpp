#include "BorderFloodMasker.hpp"
#include "AutoCropper.hpp"
#include "ImageOps.hpp"
#include <algorithm>
#include <cstdlib>
#include <queue>

using namespace cv;
using namespace std;

namespace IconForge {

int BorderFloodMasker::colorDistance(const Vec4b& a, const Vec4b& b) {
    if (a[3] == 0 && b[3] == 0) {
        return 0;
    }
    int distance = 0;
    for (int c = 0; c < 4; c++) {
        distance = std::max(distance, std::abs(static_cast<int>(a[c]) - static_cast<int>(b[c])));
    }
    return distance;
}

Mat BorderFloodMasker::backgroundMask(const Mat& rgba, int tolerance, SeedMode seedMode) {
    Mat visited = Mat::zeros(rgba.size(), CV_8UC1);
    if (!ImageOps::isRGBA(rgba)) {
        return visited;
    }

    const int w = rgba.cols;
    const int h = rgba.rows;
    queue<Point> pending;

    auto seed = [&](int x, int y) {
        uchar& mark = visited.at<uchar>(y, x);
        if (!mark) {
            mark = 255;
            pending.emplace(x, y);
        }
    };

    if (seedMode == SeedMode::Corners) {
        seed(0, 0);
        seed(w - 1, 0);
        seed(0, h - 1);
        seed(w - 1, h - 1);
    } else {
        for (int x = 0; x < w; x++) {
            seed(x, 0);
            seed(x, h - 1);
        }
        for (int y = 0; y < h; y++) {
            seed(0, y);
            seed(w - 1, y);
        }
    }

    static const Point kNeighbors[4] = {Point(1, 0), Point(-1, 0), Point(0, 1), Point(0, -1)};

    while (!pending.empty()) {
        Point p = pending.front();
        pending.pop();
        const Vec4b& here = rgba.at<Vec4b>(p);

        for (const Point& step : kNeighbors) {
            Point n = p + step;
            if (n.x < 0 || n.y < 0 || n.x >= w || n.y >= h) {
                continue;
            }
            uchar& mark = visited.at<uchar>(n);
            if (mark) {
                continue;
            }
            if (colorDistance(here, rgba.at<Vec4b>(n)) <= tolerance) {
                mark = 255;
                pending.push(n);
            }
        }
    }
    return visited;
}

Mat BorderFloodMasker::floodFromEdges(const Mat& rgba, int tolerance, SeedMode seedMode) {
    if (!ImageOps::isRGBA(rgba)) {
        return rgba.clone();
    }

    Mat alpha = ImageOps::extractAlpha(rgba);
    alpha.setTo(0, backgroundMask(rgba, tolerance, seedMode));
    return ImageOps::replaceAlpha(rgba, alpha);
}

Mat BorderFloodMasker::apply(const Mat& rgba, const BorderFloodMask& spec) {
    Mat working = spec.edgeProtectPad() ? ImageOps::padTransparent(rgba, kEdgeProtectPadding) : rgba;

    Mat masked = floodFromEdges(working, spec.tolerance(), spec.seedMode());
    if (spec.autoCropAfter()) {
        masked = AutoCropper::cropToContent(masked, kAutoCropAfterPadding);
    }
    return masked;
}

} // namespace IconForge
