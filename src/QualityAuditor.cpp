#include "QualityAuditor.hpp"
#include "ImageOps.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <unordered_set>
#include <utility>

using namespace cv;
using namespace std;

namespace IconForge {

namespace {

    double roundToTenth(double value) {
        return std::round(value * 10.0) / 10.0;
    }

    // Central differences inside, one-sided at the borders, zero along a 1-pixel axis
    Mat gradientMagnitude(const Mat& gray) {
        Mat g;
        gray.convertTo(g, CV_64F);
        Mat magnitude(g.size(), CV_64F);

        const int w = g.cols;
        const int h = g.rows;
        for (int y = 0; y < h; y++) {
            const double* row = g.ptr<double>(y);
            const double* up = g.ptr<double>(std::max(0, y - 1));
            const double* down = g.ptr<double>(std::min(h - 1, y + 1));
            double* out = magnitude.ptr<double>(y);
            for (int x = 0; x < w; x++) {
                double dx = 0.0;
                if (w > 1) {
                    if (x == 0) dx = row[1] - row[0];
                    else if (x == w - 1) dx = row[w - 1] - row[w - 2];
                    else dx = (row[x + 1] - row[x - 1]) / 2.0;
                }
                double dy = 0.0;
                if (h > 1) {
                    if (y == 0 || y == h - 1) dy = down[x] - up[x];
                    else dy = (down[x] - up[x]) / 2.0;
                }
                out[x] = std::sqrt(dx * dx + dy * dy);
            }
        }
        return magnitude;
    }

    AuditIssue makeIssue(const char* check, IssueSeverity severity, string message,
                         optional<FixAction> fix = nullopt) {
        return AuditIssue{check, severity, std::move(message), fix};
    }
}

vector<AuditIssue> QualityAuditor::auditImage(const Mat& input) {
    vector<AuditIssue> issues;
    Mat rgba = ImageOps::ensureRGBA(input);
    if (rgba.empty()) {
        issues.push_back(makeIssue("Image", IssueSeverity::Error, "Image is empty"));
        return issues;
    }

    const int width = rgba.cols;
    const int height = rgba.rows;

    if (width != height) {
        issues.push_back(makeIssue("Aspect Ratio", IssueSeverity::Error,
            "Image is not square (" + to_string(width) + "x" + to_string(height) + "). Icons must be square.",
            FixAction::CropSquare));
    } else {
        issues.push_back(makeIssue("Aspect Ratio", IssueSeverity::Pass, "Image is square"));
    }

    const int shortSide = std::min(width, height);
    if (shortSide < kMinRecommendedSize) {
        issues.push_back(makeIssue("Resolution", IssueSeverity::Warning,
            "Resolution is low (" + to_string(shortSide) + "px). Recommended: 1024px for best quality."));
    } else {
        issues.push_back(makeIssue("Resolution", IssueSeverity::Pass,
            "High resolution (" + to_string(shortSide) + "px)"));
    }

    Mat alpha = ImageOps::extractAlpha(rgba);
    double minAlpha = 0.0;
    double maxAlpha = 0.0;
    minMaxLoc(alpha, &minAlpha, &maxAlpha);
    const bool fullyOpaque = minAlpha >= 255.0;
    const bool fullyTransparent = maxAlpha <= 0.0;

    if (fullyOpaque) {
        issues.push_back(makeIssue("Transparency", IssueSeverity::Info,
            "Image is fully opaque. Use masking to remove the background if this is a logo/icon."));
    } else {
        issues.push_back(makeIssue("Transparency", IssueSeverity::Pass, "Image has transparency"));
    }

    if (!fullyOpaque && !fullyTransparent) {
        Mat soft;
        inRange(alpha, Scalar(1), Scalar(254), soft);
        const int visiblePixels = countNonZero(alpha);
        const int softPixels = countNonZero(soft);
        const double ratio = visiblePixels > 0 ? static_cast<double>(softPixels) / visiblePixels : 0.0;

        if (ratio < kAliasedRatio) {
            issues.push_back(makeIssue("Edge Quality", IssueSeverity::Error,
                "Edges appear jagged/aliased (pixelated).", FixAction::SmartCleanup));
        } else if (ratio > kBlurryRatio) {
            issues.push_back(makeIssue("Edge Quality", IssueSeverity::Warning,
                "Edges appear blurry/soft.", FixAction::Sharpen));
        } else {
            issues.push_back(makeIssue("Edge Quality", IssueSeverity::Pass, "Edges look smooth and clean"));
        }
    }

    Mat dirty;
    inRange(alpha, Scalar(1), Scalar(kDirtyAlphaCeiling - 1), dirty);
    const int dirtyPixels = countNonZero(dirty);
    if (dirtyPixels > kMaxDirtyPixels) {
        issues.push_back(makeIssue("Cleanliness", IssueSeverity::Warning,
            "Found " + to_string(dirtyPixels) + " stray/dirty pixels.", FixAction::CleanDebris));
    } else {
        issues.push_back(makeIssue("Cleanliness", IssueSeverity::Pass, "No dirty pixels detected"));
    }

    return issues;
}

QualityMetrics QualityAuditor::analyzeMetrics(const Mat& input) {
    QualityMetrics metrics;
    Mat rgba = ImageOps::ensureRGBA(input);
    if (rgba.empty()) {
        return metrics;
    }

    Mat alpha = ImageOps::extractAlpha(rgba);
    Mat gray;
    cvtColor(rgba, gray, COLOR_RGBA2GRAY);

    Mat solid = alpha > kMetricsAlphaFloor;
    if (countNonZero(solid) > 0) {
        Scalar meanGradient = mean(gradientMagnitude(gray), solid);
        metrics.sharpness = roundToTenth(std::min(meanGradient[0] * kSharpnessScale, 100.0));

        Scalar grayMean;
        Scalar grayStdDev;
        meanStdDev(gray, grayMean, grayStdDev, solid);
        metrics.contrast = roundToTenth(grayStdDev[0]);
        metrics.brightness = roundToTenth(grayMean[0]);
    }

    unordered_set<uint32_t> palette;
    for (int y = 0; y < rgba.rows; y++) {
        const Vec4b* row = rgba.ptr<Vec4b>(y);
        for (int x = 0; x < rgba.cols; x++) {
            if (row[x][3] > 0) {
                palette.insert((static_cast<uint32_t>(row[x][0]) << 16) |
                               (static_cast<uint32_t>(row[x][1]) << 8) |
                               static_cast<uint32_t>(row[x][2]));
            }
        }
    }
    metrics.paletteSize = static_cast<int>(palette.size());
    return metrics;
}

MetricsComparison QualityAuditor::compareToReference(const Mat& input, const Mat& reference) {
    Mat rgba = ImageOps::ensureRGBA(input);
    Mat ref = ImageOps::ensureRGBA(reference);
    if (!rgba.empty() && !ref.empty()) {
        ref = ImageOps::resizeRGBA(ref, rgba.size());
    }

    MetricsComparison comparison;
    comparison.yours = analyzeMetrics(rgba);
    comparison.reference = analyzeMetrics(ref);
    comparison.sharpnessDiff = comparison.yours.sharpness - comparison.reference.sharpness;
    comparison.contrastDiff = comparison.yours.contrast - comparison.reference.contrast;
    comparison.brightnessDiff = comparison.yours.brightness - comparison.reference.brightness;
    comparison.paletteDiff = comparison.yours.paletteSize - comparison.reference.paletteSize;
    return comparison;
}

vector<AuditIssue> QualityAuditor::actionableIssues(const vector<AuditIssue>& issues) {
    vector<AuditIssue> relevant;
    copy_if(issues.begin(), issues.end(), back_inserter(relevant), [](const AuditIssue& issue) {
        return issue.severity == IssueSeverity::Warning || issue.severity == IssueSeverity::Error;
    });
    return relevant;
}

const char* QualityAuditor::severityName(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::Pass: return "pass";
        case IssueSeverity::Info: return "info";
        case IssueSeverity::Warning: return "warning";
        case IssueSeverity::Error: return "error";
    }
    return "unknown";
}

const char* QualityAuditor::fixActionTag(FixAction action) {
    switch (action) {
        case FixAction::CropSquare: return "crop_square";
        case FixAction::SmartCleanup: return "smart_cleanup";
        case FixAction::Sharpen: return "sharpen";
        case FixAction::CleanDebris: return "clean_debris";
    }
    return "";
}

} // namespace IconForge
