#pragma once

#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <vector>

namespace IconForge {

enum class IssueSeverity {
    Pass,
    Info,
    Warning,
    Error
};

enum class FixAction {
    CropSquare,
    SmartCleanup,
    Sharpen,
    CleanDebris
};

struct AuditIssue {
    std::string checkName;
    IssueSeverity severity = IssueSeverity::Pass;
    std::string message;
    std::optional<FixAction> fixAction;
};

struct QualityMetrics {
    double sharpness = 0.0;   // mean gradient magnitude * 2, clamped to [0, 100]
    double contrast = 0.0;    // grayscale std-dev
    double brightness = 0.0;  // grayscale mean
    int paletteSize = 0;      // distinct RGB among visible pixels
};

// Processed-vs-reference metrics; every diff is processed - reference
struct MetricsComparison {
    QualityMetrics yours;
    QualityMetrics reference;
    double sharpnessDiff = 0.0;
    double contrastDiff = 0.0;
    double brightnessDiff = 0.0;
    int paletteDiff = 0;
};

class QualityAuditor {
public:
    static constexpr int kMinRecommendedSize = 512;
    static constexpr int kMetricsAlphaFloor = 10;
    static constexpr int kDirtyAlphaCeiling = 10;
    static constexpr int kMaxDirtyPixels = 10;
    static constexpr double kAliasedRatio = 0.01;
    static constexpr double kBlurryRatio = 0.2;
    static constexpr double kSharpnessScale = 2.0;

    static std::vector<AuditIssue> auditImage(const cv::Mat& rgba);
    static QualityMetrics analyzeMetrics(const cv::Mat& rgba);
    static MetricsComparison compareToReference(const cv::Mat& rgba, const cv::Mat& reference);

    // Warning and Error issues only
    static std::vector<AuditIssue> actionableIssues(const std::vector<AuditIssue>& issues);

    static const char* severityName(IssueSeverity severity);
    static const char* fixActionTag(FixAction action);
};

} // namespace IconForge
