#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <string>

using namespace cv;
using namespace std;

namespace IconForge {

bool ImageOps::isRGBA(const Mat& img) {
    return !img.empty() && img.type() == CV_8UC4;
}

Mat ImageOps::ensureRGBA(const Mat& img) {
    if (img.empty()) {
        return Mat();
    }

    Mat rgba;
    switch (img.type()) {
        case CV_8UC4:
            rgba = img.clone();
            break;
        case CV_8UC3:
            cvtColor(img, rgba, COLOR_RGB2RGBA);
            break;
        case CV_8UC1:
            cvtColor(img, rgba, COLOR_GRAY2RGBA);
            break;
        default:
            throw invalid_argument("Unsupported image type " + to_string(img.type()) +
                                   " (expected 8-bit gray, RGB or RGBA)");
    }
    return rgba;
}

Mat ImageOps::fromDecoded(const Mat& decoded) {
    if (decoded.empty()) {
        return Mat();
    }

    Mat eightBit = decoded;
    if (decoded.depth() == CV_16U) {
        decoded.convertTo(eightBit, CV_MAKETYPE(CV_8U, decoded.channels()), 1.0 / 257.0);
    } else if (decoded.depth() != CV_8U) {
        throw invalid_argument("Unsupported decoded image depth " + to_string(decoded.depth()));
    }

    Mat rgba;
    switch (eightBit.channels()) {
        case 4: cvtColor(eightBit, rgba, COLOR_BGRA2RGBA); break;
        case 3: cvtColor(eightBit, rgba, COLOR_BGR2RGBA); break;
        case 1: cvtColor(eightBit, rgba, COLOR_GRAY2RGBA); break;
        default:
            throw invalid_argument("Unsupported channel count " + to_string(eightBit.channels()));
    }
    return rgba;
}

Mat ImageOps::toEncodable(const Mat& rgba) {
    Mat bgra;
    cvtColor(ensureRGBA(rgba), bgra, COLOR_RGBA2BGRA);
    return bgra;
}

Mat ImageOps::extractAlpha(const Mat& rgba) {
    Mat alpha;
    extractChannel(rgba, alpha, 3);
    return alpha;
}

Mat ImageOps::replaceAlpha(const Mat& rgba, const Mat& alpha) {
    if (alpha.size() != rgba.size() || alpha.type() != CV_8UC1) {
        throw invalid_argument("Alpha plane must be CV_8UC1 and match the image size");
    }
    Mat result = rgba.clone();
    insertChannel(alpha, result, 3);
    return result;
}

Mat ImageOps::padTransparent(const Mat& rgba, int border) {
    if (border <= 0) {
        return rgba.clone();
    }
    Mat padded;
    // Isolated so a cropped ROI never pulls parent pixels into the border
    copyMakeBorder(rgba, padded, border, border, border, border, BORDER_CONSTANT | BORDER_ISOLATED, Scalar::all(0));
    return padded;
}

int ImageOps::chooseInterpolation(const Size& from, const Size& to) {
    if (to.width < from.width || to.height < from.height) {
        return INTER_AREA;
    }
    return INTER_LANCZOS4;
}

Mat ImageOps::resizeRGBA(const Mat& rgba, const Size& size) {
    return resizeRGBA(rgba, size, chooseInterpolation(rgba.size(), size));
}

Mat ImageOps::resizeRGBA(const Mat& rgba, const Size& size, int interpolation) {
    if (rgba.empty()) {
        return Mat();
    }
    if (size.width <= 0 || size.height <= 0) {
        throw invalid_argument("Resize target must be positive, got " +
                               to_string(size.width) + "x" + to_string(size.height));
    }
    if (size == rgba.size()) {
        return rgba.clone();
    }

    Mat scaled;
    resize(premultiply(rgba), scaled, size, 0, 0, interpolation);
    return unpremultiply(scaled);
}

Mat ImageOps::premultiply(const Mat& rgba) {
    Mat premultiplied(rgba.size(), CV_32FC4);
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4b* src = rgba.ptr<Vec4b>(y);
        Vec4f* dst = premultiplied.ptr<Vec4f>(y);
        for (int x = 0; x < rgba.cols; x++) {
            float a = src[x][3] / 255.0f;
            dst[x] = Vec4f(src[x][0] * a, src[x][1] * a, src[x][2] * a, static_cast<float>(src[x][3]));
        }
    }
    return premultiplied;
}

Mat ImageOps::unpremultiply(const Mat& premultiplied) {
    if (premultiplied.type() != CV_32FC4) {
        throw invalid_argument("Premultiplied image must be CV_32FC4");
    }
    Mat result(premultiplied.size(), CV_8UC4);
    for (int y = 0; y < premultiplied.rows; y++) {
        const Vec4f* src = premultiplied.ptr<Vec4f>(y);
        Vec4b* dst = result.ptr<Vec4b>(y);
        for (int x = 0; x < premultiplied.cols; x++) {
            float a = std::clamp(src[x][3], 0.0f, 255.0f);
            uchar alpha = saturate_cast<uchar>(a);
            if (alpha == 0) {
                dst[x] = Vec4b(0, 0, 0, 0);
                continue;
            }
            float unmultiply = 255.0f / a;
            dst[x] = Vec4b(saturate_cast<uchar>(src[x][0] * unmultiply),
                           saturate_cast<uchar>(src[x][1] * unmultiply),
                           saturate_cast<uchar>(src[x][2] * unmultiply),
                           alpha);
        }
    }
    return result;
}

Mat ImageOps::alphaComposite(const Mat& bottom, const Mat& top) {
    if (!isRGBA(bottom) || !isRGBA(top) || bottom.size() != top.size()) {
        throw invalid_argument("Source-over needs two RGBA images of the same size");
    }

    Mat result(bottom.size(), CV_8UC4);
    for (int y = 0; y < bottom.rows; y++) {
        const Vec4b* dstRow = bottom.ptr<Vec4b>(y);
        const Vec4b* srcRow = top.ptr<Vec4b>(y);
        Vec4b* out = result.ptr<Vec4b>(y);
        for (int x = 0; x < bottom.cols; x++) {
            double sa = srcRow[x][3] / 255.0;
            double da = dstRow[x][3] / 255.0;
            double oa = sa + da * (1.0 - sa);
            if (oa <= 0.0) {
                out[x] = Vec4b(0, 0, 0, 0);
                continue;
            }
            Vec4b px;
            for (int c = 0; c < 3; c++) {
                double v = (srcRow[x][c] * sa + dstRow[x][c] * da * (1.0 - sa)) / oa;
                px[c] = saturate_cast<uchar>(v);
            }
            px[3] = saturate_cast<uchar>(oa * 255.0);
            out[x] = px;
        }
    }
    return result;
}

Mat ImageOps::levelsLut(int lo, int hi) {
    Mat lut(1, 256, CV_8U);
    uchar* table = lut.ptr<uchar>();
    for (int x = 0; x < 256; x++) {
        if (hi <= lo) {
            table[x] = x > lo ? 255 : 0;
        } else if (x <= lo) {
            table[x] = 0;
        } else if (x >= hi) {
            table[x] = 255;
        } else {
            table[x] = static_cast<uchar>((x - lo) * 255 / (hi - lo));
        }
    }
    return lut;
}

Mat ImageOps::unsharpMask(const Mat& img, double radius, int percent, int threshold) {
    if (img.empty() || radius <= 0.0 || percent == 0) {
        return img.clone();
    }
    CV_Assert(img.depth() == CV_8U);

    Mat blurred;
    GaussianBlur(img, blurred, Size(0, 0), radius);

    Mat result = img.clone();
    const int samplesPerRow = img.cols * img.channels();
    const double gain = percent / 100.0;
    for (int y = 0; y < img.rows; y++) {
        const uchar* src = img.ptr<uchar>(y);
        const uchar* blur = blurred.ptr<uchar>(y);
        uchar* dst = result.ptr<uchar>(y);
        for (int i = 0; i < samplesPerRow; i++) {
            int diff = static_cast<int>(src[i]) - static_cast<int>(blur[i]);
            if (std::abs(diff) > threshold) {
                dst[i] = saturate_cast<uchar>(src[i] + diff * gain);
            }
        }
    }
    return result;
}

} // namespace IconForge
