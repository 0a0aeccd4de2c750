#include <cassert>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "AlphaMorphology.hpp"
#include "AutoCropper.hpp"
#include "BorderFloodMasker.hpp"
#include "CompositionEngine.hpp"
#include "ContentMasker.hpp"
#include "EdgeRefiner.hpp"
#include "IconExporter.hpp"
#include "IconForgeAPI.h"
#include "IconPipeline.hpp"
#include "ImageOps.hpp"
#include "LiquidPolisher.hpp"
#include "QualityAuditor.hpp"
#include "StrokeGenerator.hpp"

using namespace IconForge;

static const cv::Vec4b kRed(255, 0, 0, 255);
static const cv::Vec4b kGreen(0, 255, 0, 255);
static const cv::Vec4b kBlue(0, 0, 255, 255);
static const cv::Vec4b kWhite(255, 255, 255, 255);
static const cv::Vec4b kClear(0, 0, 0, 0);

static cv::Mat Filled(int w, int h, const cv::Vec4b& color) {
    return cv::Mat(h, w, CV_8UC4, cv::Scalar(color[0], color[1], color[2], color[3]));
}

static void FillRect(cv::Mat& img, const cv::Rect& r, const cv::Vec4b& color) {
    img(r).setTo(cv::Scalar(color[0], color[1], color[2], color[3]));
}

static bool SameImage(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && (a.empty() || cv::norm(a, b, cv::NORM_INF) == 0.0);
}

static cv::Mat RandomMask(int w, int h, unsigned seed) {
    std::mt19937 rng{ seed };
    std::uniform_int_distribution<int> value(0, 255);
    cv::Mat mask(h, w, CV_8UC1);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            mask.at<uchar>(y, x) = static_cast<uchar>(value(rng) > 160 ? value(rng) : 0);
        }
    }
    return mask;
}

// White backdrop with a red block and a smaller blue accent
static cv::Mat MakeArtwork(int w, int h) {
    cv::Mat img = Filled(w, h, kWhite);
    FillRect(img, cv::Rect(w / 4, h / 4, w / 2, h / 2), kRed);
    FillRect(img, cv::Rect(w / 3, h / 3, w / 6, h / 6), kBlue);
    return img;
}

static void TestSpecConstructionRejectsBadRanges() {
    auto throwsInvalid = [](auto build) {
        try {
            build();
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    assert(throwsInvalid([] { ColorKey(Color{255, 255, 255}, 256); }));
    assert(throwsInvalid([] { ColorKey(Color{0, 0, 0}, -1); }));
    assert(throwsInvalid([] { AutoCropMask(-1); }));
    assert(throwsInvalid([] { ColorKeyMask({}, true); }));
    assert(throwsInvalid([] { BorderFloodMask(300, SeedMode::Corners, true, false); }));
    assert(throwsInvalid([] { CompositionSpec(FitMode::Contain, 1.0, 0); }));
    assert(throwsInvalid([] { CompositionSpec(FitMode::Cover, 0.4, 1024); }));
    assert(throwsInvalid([] { CompositionSpec(FitMode::Cover, 1.6, 1024); }));
    assert(throwsInvalid([] { StrokeSpec(RGBAColor{}, 0); }));
    assert(throwsInvalid([] { StrokeSpec(RGBAColor{}, 51); }));
    assert(throwsInvalid([] { MorphologySpec(11); }));
    assert(throwsInvalid([] { LiquidPolishSpec(1.5); }));
    assert(throwsInvalid([] { EdgeRefineSpec(51); }));
    assert(throwsInvalid([] { EdgeRefineSpec(10, 0.3, 101); }));

    assert(!throwsInvalid([] { ColorKey(Color{1, 2, 3}, 255); }));
    assert(!throwsInvalid([] { AutoCropMask(0); }));
    assert(CompositionSpec::safeMargin().scale() == 0.9);
    assert(CompositionSpec::safeMargin().targetSize() == 1024);
    assert(!LiquidPolishSpec().enabled());
    assert(LiquidPolishSpec(0.2).enabled());
}

static void TestMorphologyIdentityAndClosing() {
    cv::Mat mask = RandomMask(40, 30, 12345);

    assert(SameImage(AlphaMorphology::expandMask(mask, 0), mask));
    assert(SameImage(AlphaMorphology::chokeMask(mask, 0), mask));

    for (int n : {1, 2, 3}) {
        cv::Mat closed = AlphaMorphology::chokeMask(AlphaMorphology::expandMask(mask, n), n);
        for (int y = 0; y < mask.rows; ++y) {
            for (int x = 0; x < mask.cols; ++x) {
                assert(closed.at<uchar>(y, x) >= mask.at<uchar>(y, x));
            }
        }

        cv::Mat opened = AlphaMorphology::expandMask(AlphaMorphology::chokeMask(mask, n), n);
        for (int y = 0; y < mask.rows; ++y) {
            for (int x = 0; x < mask.cols; ++x) {
                assert(opened.at<uchar>(y, x) <= mask.at<uchar>(y, x));
            }
        }
    }

    cv::Mat twice = AlphaMorphology::expandMask(AlphaMorphology::expandMask(mask, 1), 3);
    cv::Mat once = AlphaMorphology::expandMask(mask, 3);
    cv::Mat below;
    cv::compare(twice, once, below, cv::CMP_LT);
    assert(cv::countNonZero(below) == 0);

    // RGB survives shape weight; only alpha moves
    cv::Mat img = Filled(20, 20, kClear);
    FillRect(img, cv::Rect(5, 5, 10, 10), kRed);
    cv::Mat grown = AlphaMorphology::applyShapeWeight(img, 2);
    assert(grown.at<cv::Vec4b>(3, 3)[3] == 255);
    assert(grown.at<cv::Vec4b>(2, 2)[3] == 0);
    cv::Mat shrunk = AlphaMorphology::applyShapeWeight(img, -2);
    assert(shrunk.at<cv::Vec4b>(6, 6)[3] == 0);
    assert(shrunk.at<cv::Vec4b>(7, 7)[3] == 255);
    assert(shrunk.at<cv::Vec4b>(6, 6)[0] == 255);
    assert(SameImage(AlphaMorphology::applyShapeWeight(img, 0), img));
}

static void TestAutoCropIsIdempotent() {
    cv::Mat img = Filled(30, 20, kClear);
    FillRect(img, cv::Rect(5, 3, 5, 5), kRed);

    cv::Mat once = AutoCropper::cropToContent(img, 3);
    assert(once.cols == 11 && once.rows == 11);
    assert(once.at<cv::Vec4b>(3, 3) == kRed);
    assert(once.at<cv::Vec4b>(2, 2)[3] == 0);

    cv::Mat twice = AutoCropper::cropToContent(once, 3);
    assert(SameImage(once, twice));

    cv::Mat empty = Filled(7, 9, kClear);
    assert(!AutoCropper::contentBounds(empty));
    assert(SameImage(AutoCropper::cropToContent(empty, 4), empty));

    bool threw = false;
    try {
        AutoCropper::cropToContent(img, -1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void TestCompositionIsAlwaysTargetSquare() {
    const std::vector<cv::Mat> inputs = {
        Filled(1, 1, kRed), MakeArtwork(100, 30), MakeArtwork(30, 100), Filled(5, 5, kClear)
    };
    for (const cv::Mat& input : inputs) {
        for (FitMode fit : {FitMode::Contain, FitMode::Cover}) {
            for (double scale : {0.5, 0.9, 1.0, 1.5}) {
                for (int target : {1, 17, 64}) {
                    cv::Mat out = CompositionEngine::compose(input, CompositionSpec(fit, scale, target));
                    assert(out.cols == target && out.rows == target);
                    assert(out.type() == CV_8UC4);
                }
            }
        }
    }

    // Contain leaves transparent bars, cover fills the canvas
    cv::Mat wide = Filled(100, 50, kRed);
    cv::Mat contained = CompositionEngine::compose(wide, CompositionSpec(FitMode::Contain, 1.0, 64));
    assert(contained.at<cv::Vec4b>(0, 32)[3] == 0);
    assert(contained.at<cv::Vec4b>(32, 32) == kRed);
    cv::Mat covered = CompositionEngine::compose(wide, CompositionSpec(FitMode::Cover, 1.0, 64));
    assert(covered.at<cv::Vec4b>(0, 32) == kRed);
    assert(covered.at<cv::Vec4b>(63, 0) == kRed);
}

static void TestCoverOfThinSourceRendersOnlyTheCanvas() {
    // Cover on a 2x4000 strip enlarges it to 1024 x 2048000; only the canvas may be rendered
    cv::Mat strip = Filled(2, 4000, kRed);
    cv::Mat covered = CompositionEngine::compose(strip, CompositionSpec(FitMode::Cover, 1.0, 1024));
    assert(covered.cols == 1024 && covered.rows == 1024);
    assert(covered.type() == CV_8UC4);
    assert(covered.at<cv::Vec4b>(0, 0) == kRed);
    assert(covered.at<cv::Vec4b>(512, 512) == kRed);
    assert(covered.at<cv::Vec4b>(1023, 1023) == kRed);

    // Overflow on one axis only keeps the transparent bars on the other
    cv::Mat wide = CompositionEngine::compose(Filled(40, 10, kRed), CompositionSpec(FitMode::Contain, 1.5, 32));
    assert(wide.cols == 32 && wide.rows == 32);
    assert(wide.at<cv::Vec4b>(16, 0) == kRed);
    assert(wide.at<cv::Vec4b>(16, 31) == kRed);
    assert(wide.at<cv::Vec4b>(2, 16)[3] == 0);
    assert(wide.at<cv::Vec4b>(29, 16)[3] == 0);

    cv::Mat contained = CompositionEngine::compose(strip, CompositionSpec(FitMode::Contain, 1.0, 1024));
    assert(contained.cols == 1024 && contained.rows == 1024);
    assert(contained.at<cv::Vec4b>(512, 0)[3] == 0);
}

static void TestBorderFloodUniformImageIsFullyRemoved() {
    cv::Mat img = Filled(16, 12, cv::Vec4b(40, 80, 120, 255));
    cv::Mat flooded = BorderFloodMasker::floodFromEdges(img, 0, SeedMode::Corners);
    assert(cv::countNonZero(ImageOps::extractAlpha(flooded)) == 0);
    // Color data is kept under the cleared alpha
    assert(flooded.at<cv::Vec4b>(5, 5)[2] == 120);
}

static void TestBorderFloodRemovesOnlyConnectedBorder() {
    cv::Mat img = Filled(64, 64, kGreen);
    FillRect(img, cv::Rect(8, 8, 48, 48), kRed);

    cv::Mat flooded = BorderFloodMasker::floodFromEdges(img, 10, SeedMode::Corners);
    for (int y = 0; y < 64; ++y) {
        for (int x = 0; x < 64; ++x) {
            const bool inner = x >= 8 && x < 56 && y >= 8 && y < 56;
            assert(flooded.at<cv::Vec4b>(y, x)[3] == (inner ? 255 : 0));
        }
    }

    cv::Mat cropped = BorderFloodMasker::apply(img, BorderFloodMask(10, SeedMode::Corners, true, false));
    assert(cropped.cols == 48 + 2 * kAutoCropAfterPadding);
    assert(cropped.rows == 48 + 2 * kAutoCropAfterPadding);
}

static void TestBorderFloodKeepsEnclosedBackground() {
    // White frame of black ring with white inside: the inner white is not reachable
    cv::Mat img = Filled(32, 32, kWhite);
    FillRect(img, cv::Rect(8, 8, 16, 16), cv::Vec4b(0, 0, 0, 255));
    FillRect(img, cv::Rect(11, 11, 10, 10), kWhite);

    cv::Mat flooded = BorderFloodMasker::floodFromEdges(img, 10, SeedMode::AllEdges);
    assert(flooded.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(flooded.at<cv::Vec4b>(9, 9)[3] == 255);
    assert(flooded.at<cv::Vec4b>(16, 16)[3] == 255);

    cv::Mat keyed = ContentMasker::applyColorKeys(img, {ColorKey(Color{255, 255, 255}, 10)});
    assert(keyed.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(keyed.at<cv::Vec4b>(16, 16)[3] == 0);
    assert(keyed.at<cv::Vec4b>(9, 9)[3] == 255);
}

static void TestEdgeProtectPadSavesFullBleedArt() {
    cv::Mat img = Filled(20, 20, kRed);

    cv::Mat unprotected = BorderFloodMasker::apply(img, BorderFloodMask(30, SeedMode::Corners, false, false));
    assert(cv::countNonZero(ImageOps::extractAlpha(unprotected)) == 0);

    cv::Mat padded = BorderFloodMasker::apply(img, BorderFloodMask(30, SeedMode::Corners, false, true));
    assert(padded.cols == 20 + 2 * kEdgeProtectPadding);
    assert(cv::countNonZero(ImageOps::extractAlpha(padded)) == 20 * 20);

    cv::Mat cropped = BorderFloodMasker::apply(img, BorderFloodMask(30, SeedMode::Corners, true, true));
    assert(cropped.cols == 20 + 2 * kAutoCropAfterPadding);
    assert(cropped.at<cv::Vec4b>(kAutoCropAfterPadding, kAutoCropAfterPadding) == kRed);
}

static void TestColorKeysAreUnioned() {
    cv::Mat img = Filled(10, 10, kWhite);
    FillRect(img, cv::Rect(0, 0, 5, 10), cv::Vec4b(250, 250, 250, 255));
    FillRect(img, cv::Rect(3, 3, 4, 4), kRed);

    cv::Mat single = ContentMasker::applyColorKeys(img, {ColorKey(Color{255, 255, 255}, 0)});
    assert(single.at<cv::Vec4b>(0, 9)[3] == 0);
    assert(single.at<cv::Vec4b>(0, 0)[3] == 255);

    cv::Mat both = ContentMasker::applyColorKeys(img, {ColorKey(Color{255, 255, 255}, 0),
                                                       ColorKey(Color{250, 250, 250}, 0)});
    assert(both.at<cv::Vec4b>(0, 9)[3] == 0);
    assert(both.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(both.at<cv::Vec4b>(4, 4) == kRed);
    // RGB kept under removed pixels
    assert(both.at<cv::Vec4b>(0, 0)[0] == 250);

    cv::Mat cropped = ContentMasker::apply(img, ColorKeyMask({ColorKey(Color{252, 252, 252}, 3)}, true));
    assert(cropped.cols == 4 + 2 * kAutoCropAfterPadding);
}

static int Chebyshev(int x, int y, const cv::Rect& r) {
    const int dx = std::max({r.x - x, x - (r.x + r.width - 1), 0});
    const int dy = std::max({r.y - y, y - (r.y + r.height - 1), 0});
    return std::max(dx, dy);
}

static void TestOutsideStrokeRing() {
    const RGBAColor blue{0, 0, 255, 255};

    // 10px margin: the whole 5px ring fits
    const cv::Rect square(10, 10, 32, 32);
    cv::Mat img = Filled(52, 52, kClear);
    FillRect(img, square, kRed);

    cv::Mat stroked = StrokeGenerator::apply(img, StrokeSpec(blue, 5, StrokeAlignment::Outside));
    for (int y = 0; y < 52; ++y) {
        for (int x = 0; x < 52; ++x) {
            const int d = Chebyshev(x, y, square);
            const cv::Vec4b px = stroked.at<cv::Vec4b>(y, x);
            if (d == 0) {
                assert(px == kRed);
            } else if (d <= 5) {
                assert(px == kBlue);
            } else {
                assert(px[3] == 0);
            }
        }
    }

    // 4px margin: the ring is clipped by the canvas
    cv::Mat tight = Filled(40, 40, kClear);
    FillRect(tight, cv::Rect(4, 4, 32, 32), kRed);
    cv::Mat ring = StrokeGenerator::apply(tight, StrokeSpec(blue, 5, StrokeAlignment::Outside));
    for (int y = 0; y < 40; ++y) {
        for (int x = 0; x < 40; ++x) {
            const bool inside = x >= 4 && x < 36 && y >= 4 && y < 36;
            assert(ring.at<cv::Vec4b>(y, x) == (inside ? kRed : kBlue));
        }
    }
}

static void TestInsideAndCenterStroke() {
    const RGBAColor blue{0, 0, 255, 255};
    const cv::Rect square(10, 10, 32, 32);
    cv::Mat img = Filled(52, 52, kClear);
    FillRect(img, square, kRed);

    cv::Mat inside = StrokeGenerator::apply(img, StrokeSpec(blue, 5, StrokeAlignment::Inside));
    assert(inside.at<cv::Vec4b>(10, 10) == kBlue);
    assert(inside.at<cv::Vec4b>(14, 20) == kBlue);
    assert(inside.at<cv::Vec4b>(15, 20) == kRed);
    assert(inside.at<cv::Vec4b>(9, 20)[3] == 0);

    cv::Mat center = StrokeGenerator::apply(img, StrokeSpec(blue, 4, StrokeAlignment::Center));
    assert(center.at<cv::Vec4b>(8, 20) == kBlue);
    assert(center.at<cv::Vec4b>(7, 20)[3] == 0);
    assert(center.at<cv::Vec4b>(11, 20) == kBlue);
    assert(center.at<cv::Vec4b>(12, 20) == kRed);

    // Translucent stroke color scales the band
    cv::Mat faint = StrokeGenerator::apply(img, StrokeSpec(RGBAColor{0, 0, 255, 128}, 2));
    assert(faint.at<cv::Vec4b>(8, 20)[3] == 128);
}

static void TestLiquidPolishZeroIsIdentity() {
    cv::Mat img = MakeArtwork(24, 24);
    FillRect(img, cv::Rect(0, 0, 4, 24), kClear);
    assert(SameImage(LiquidPolisher::apply(img, LiquidPolishSpec(0.0)), img));

    cv::Mat polished = LiquidPolisher::apply(img, LiquidPolishSpec(0.5));
    assert(polished.size() == img.size());
    assert(polished.type() == CV_8UC4);
}

static void TestEdgeRefinerRemovesDebris() {
    cv::Mat img = Filled(8, 8, cv::Vec4b(10, 20, 30, 250));
    img.at<cv::Vec4b>(0, 0)[3] = 5;

    cv::Mat cleaned = EdgeRefiner::cleanEdges(img, 10, 0.0);
    assert(cleaned.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(cleaned.at<cv::Vec4b>(4, 4)[3] == 255);
    assert(cleaned.at<cv::Vec4b>(4, 4)[0] == 10);

    // Neutral settings leave a hard-edged image alone
    cv::Mat hard = Filled(16, 16, kClear);
    FillRect(hard, cv::Rect(4, 4, 8, 8), kRed);
    assert(SameImage(EdgeRefiner::refine(hard, EdgeRefineSpec(10, 0.0, 50, 0)), hard));
}

static void TestCleanEdgesRampStartsAtThreshold() {
    cv::Mat img = Filled(6, 1, kRed);
    const uchar alphas[] = {5, 10, 12, 60, 80, 250};
    for (int x = 0; x < 6; ++x) {
        img.at<cv::Vec4b>(0, x)[3] = alphas[x];
    }

    cv::Mat cleaned = EdgeRefiner::cleanEdges(img, 10, 0.0);
    assert(cleaned.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(cleaned.at<cv::Vec4b>(0, 1)[3] == 0);
    // Just above the threshold stays faint
    assert(cleaned.at<cv::Vec4b>(0, 2)[3] == 6);
    // Mid-ramp alpha is pushed toward opaque
    assert(cleaned.at<cv::Vec4b>(0, 3)[3] == 159);
    assert(cleaned.at<cv::Vec4b>(0, 4)[3] == 223);
    assert(cleaned.at<cv::Vec4b>(0, 5)[3] == 255);
    assert(cleaned.at<cv::Vec4b>(0, 3)[0] == 255);

    // Ramp is clamped at 255 for high thresholds
    cv::Mat high = EdgeRefiner::cleanEdges(img, 50, 0.0);
    assert(high.at<cv::Vec4b>(0, 3)[3] == 31);
    assert(high.at<cv::Vec4b>(0, 5)[3] == 255);
}

static void TestCornerSharpnessRoundsAndSharpens() {
    cv::Mat square = Filled(40, 40, kClear);
    FillRect(square, cv::Rect(10, 10, 20, 20), kRed);

    cv::Mat rounded = EdgeRefiner::applyCornerSharpness(square, 10);
    assert(rounded.at<cv::Vec4b>(10, 10)[3] == 0);
    assert(rounded.at<cv::Vec4b>(11, 11)[3] == 0);
    assert(rounded.at<cv::Vec4b>(13, 13)[3] == 255);
    assert(rounded.at<cv::Vec4b>(20, 10)[3] == 255);
    assert(rounded.at<cv::Vec4b>(20, 11)[3] == 255);
    assert(rounded.at<cv::Vec4b>(20, 20) == kRed);
    assert(rounded.at<cv::Vec4b>(0, 0)[3] == 0);
    for (int y = 0; y < rounded.rows; ++y) {
        for (int x = 0; x < rounded.cols; ++x) {
            const uchar a = rounded.at<cv::Vec4b>(y, x)[3];
            assert(a == 0 || a == 255);
        }
    }

    assert(SameImage(EdgeRefiner::applyCornerSharpness(square, 50), square));

    // Above neutral: an opaque gray step gets overshoot on both sides of the edge
    cv::Mat step = Filled(32, 8, cv::Vec4b(100, 100, 100, 255));
    FillRect(step, cv::Rect(16, 0, 16, 8), cv::Vec4b(150, 150, 150, 255));
    cv::Mat sharp = EdgeRefiner::applyCornerSharpness(step, 100);
    assert(sharp.at<cv::Vec4b>(4, 16)[0] > 150);
    assert(sharp.at<cv::Vec4b>(4, 15)[0] < 100);
    assert(sharp.at<cv::Vec4b>(4, 0)[0] == 100);
    assert(sharp.at<cv::Vec4b>(4, 31)[0] == 150);
    assert(sharp.at<cv::Vec4b>(4, 16)[3] == 255);
}

static void TestResolutionSnapSharpensEdges() {
    cv::Mat step = Filled(32, 8, cv::Vec4b(100, 100, 100, 255));
    FillRect(step, cv::Rect(16, 0, 16, 8), cv::Vec4b(150, 150, 150, 255));

    assert(SameImage(EdgeRefiner::applyResolutionSnap(step, 0), step));

    cv::Mat snapped = EdgeRefiner::applyResolutionSnap(step, 100);
    assert(snapped.at<cv::Vec4b>(4, 16)[0] > 150);
    assert(snapped.at<cv::Vec4b>(4, 15)[0] < 100);
    assert(snapped.at<cv::Vec4b>(4, 0)[0] == 100);
    assert(snapped.at<cv::Vec4b>(4, 31)[0] == 150);
    assert(snapped.at<cv::Vec4b>(4, 16)[3] == 255);
}

static void TestLiquidPolishRoundsCorners() {
    cv::Mat img = Filled(48, 48, kClear);
    FillRect(img, cv::Rect(12, 12, 24, 24), kRed);

    cv::Mat polished = LiquidPolisher::apply(img, LiquidPolishSpec(0.5));
    assert(polished.at<cv::Vec4b>(24, 24)[3] == 255);
    assert(polished.at<cv::Vec4b>(0, 0)[3] == 0);
    assert(polished.at<cv::Vec4b>(47, 47)[3] == 0);
    assert(polished.at<cv::Vec4b>(12, 12)[3] < 128);
}

static void TestMetricsOnTransparentAndFlatImages() {
    QualityMetrics clear = QualityAuditor::analyzeMetrics(Filled(32, 32, kClear));
    assert(clear.sharpness == 0.0);
    assert(clear.contrast == 0.0);
    assert(clear.brightness == 0.0);
    assert(clear.paletteSize == 0);

    QualityMetrics flat = QualityAuditor::analyzeMetrics(Filled(8, 8, cv::Vec4b(128, 128, 128, 255)));
    assert(flat.sharpness == 0.0);
    assert(flat.contrast == 0.0);
    assert(flat.brightness == 128.0);
    assert(flat.paletteSize == 1);

    MetricsComparison cmp = QualityAuditor::compareToReference(MakeArtwork(64, 64), Filled(16, 16, kClear));
    assert(cmp.reference.paletteSize == 0);
    assert(cmp.paletteDiff == cmp.yours.paletteSize);
    assert(cmp.yours.sharpness > 0.0);
}

static void TestAuditFlagsIssues() {
    std::vector<AuditIssue> issues = QualityAuditor::auditImage(Filled(600, 400, kRed));
    assert(issues.size() == 4);
    assert(issues[0].checkName == "Aspect Ratio");
    assert(issues[0].severity == IssueSeverity::Error);
    assert(issues[0].fixAction && *issues[0].fixAction == FixAction::CropSquare);
    assert(issues[1].checkName == "Resolution" && issues[1].severity == IssueSeverity::Warning);
    assert(issues[2].checkName == "Transparency" && issues[2].severity == IssueSeverity::Info);
    assert(issues[3].checkName == "Cleanliness" && issues[3].severity == IssueSeverity::Pass);
    assert(QualityAuditor::actionableIssues(issues).size() == 2);

    cv::Mat jagged = Filled(600, 600, kClear);
    FillRect(jagged, cv::Rect(100, 100, 400, 400), kRed);
    for (int i = 0; i < 20; ++i) {
        jagged.at<cv::Vec4b>(10, 10 + 2 * i) = cv::Vec4b(0, 0, 0, 5);
    }
    issues = QualityAuditor::auditImage(jagged);
    assert(issues.size() == 5);
    assert(issues[3].checkName == "Edge Quality");
    assert(issues[3].severity == IssueSeverity::Error);
    assert(*issues[3].fixAction == FixAction::SmartCleanup);
    assert(issues[4].checkName == "Cleanliness" && issues[4].severity == IssueSeverity::Warning);
    assert(*issues[4].fixAction == FixAction::CleanDebris);

    issues = QualityAuditor::auditImage(cv::Mat());
    assert(issues.size() == 1 && issues[0].severity == IssueSeverity::Error);

    assert(std::string(QualityAuditor::severityName(IssueSeverity::Warning)) == "warning");
    assert(std::string(QualityAuditor::fixActionTag(FixAction::SmartCleanup)) == "smart_cleanup");
}

static void TestFixActionsAdjustSpec() {
    PipelineSpec spec;
    spec.edgeRefine = EdgeRefineSpec(2, 0.3, 50, 10);

    PipelineSpec cleanup = IconPipeline::applyFix(spec, FixAction::SmartCleanup);
    assert(cleanup.edgeRefine.smoothBlurRadius() == 0.1);
    assert(cleanup.edgeRefine.cornerSharpness() == 80);

    assert(IconPipeline::applyFix(spec, FixAction::Sharpen).edgeRefine.resolutionSnap() == 50);
    assert(IconPipeline::applyFix(spec, FixAction::CleanDebris).edgeRefine.debrisThreshold() == 10);
    assert(IconPipeline::applyFix(spec, FixAction::CropSquare).composition.fitMode() == FitMode::Cover);
    // Original untouched
    assert(spec.edgeRefine.debrisThreshold() == 2);
}

static PipelineSpec FullSpec(int target) {
    PipelineSpec spec;
    spec.masking = BorderFloodMask(30, SeedMode::Corners, true, false);
    spec.composition = CompositionSpec(FitMode::Contain, 0.9, target);
    spec.morphology = MorphologySpec(1);
    spec.stroke = StrokeSpec(RGBAColor{255, 255, 255, 255}, 3);
    spec.liquidPolish = LiquidPolishSpec(0.3);
    spec.edgeRefine = EdgeRefineSpec(10, 0.5, 60, 20);
    return spec;
}

static void TestPipelineIsDeterministic() {
    const cv::Mat source = MakeArtwork(80, 50);
    const cv::Mat pristine = source.clone();
    const PipelineSpec spec = FullSpec(128);

    std::vector<std::string> stages;
    IconPipeline::PipelineOptions options;
    options.stageCallback = [&stages](const std::string& stage, const cv::Mat& image) {
        stages.push_back(stage);
        assert(!image.empty());
    };

    cv::Mat first = IconPipeline::process(source, spec, options);
    cv::Mat second = IconPipeline::process(source, spec);
    assert(first.cols == 128 && first.rows == 128);
    assert(SameImage(first, second));
    assert(SameImage(source, pristine));
    assert(stages.size() == 6);
    assert(stages.front() == "masked" && stages.back() == "refined");

    // Background is gone: the canvas corner is transparent
    assert(first.at<cv::Vec4b>(0, 0)[3] == 0);

    cv::Mat masked = IconPipeline::processToStage(source, spec, PipelineStage::Masked, options);
    assert(masked.cols == 40 + 2 * kAutoCropAfterPadding);
    cv::Mat composed = IconPipeline::processToStage(source, spec, PipelineStage::Composed, options);
    assert(composed.cols == 128 && composed.rows == 128);

    bool threw = false;
    try {
        IconPipeline::process(cv::Mat(), spec);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

static void TestPipelineHandlesDegenerateInputs() {
    PipelineSpec spec = FullSpec(32);
    for (const cv::Mat& input : {Filled(1, 1, kRed), Filled(1, 1, kClear), Filled(9, 9, kClear)}) {
        cv::Mat out = IconPipeline::process(input, spec);
        assert(out.cols == 32 && out.rows == 32);
    }
    spec.masking = AutoCropMask(2);
    cv::Mat out = IconPipeline::process(Filled(12, 6, kClear), spec);
    assert(out.cols == 32 && cv::countNonZero(ImageOps::extractAlpha(out)) == 0);
}

static void TestExportSizes() {
    cv::Mat master = IconPipeline::process(MakeArtwork(64, 64), FullSpec(128));

    ExportOptions options;
    options.sizes = {16, 32, 48, 100};
    options.threadLimit = 2;
    options.binaryAlpha = true;
    ExportResult result = IconExporter::exportSizes(master, options);
    assert(!result.cancelled);
    assert(result.images.size() == 4);
    assert(result.binaryAlphaImages.size() == 4);
    for (const auto& [size, image] : result.images) {
        assert(image.cols == size && image.rows == size);
        cv::Mat alpha = ImageOps::extractAlpha(result.binaryAlphaImages[size]);
        cv::Mat soft;
        cv::inRange(alpha, cv::Scalar(1), cv::Scalar(254), soft);
        assert(cv::countNonZero(soft) == 0);
    }

    // Worker count does not change the pixels
    options.threadLimit = 1;
    ExportResult serial = IconExporter::exportSizes(master, options);
    for (const auto& [size, image] : result.images) {
        assert(SameImage(image, serial.images[size]));
    }

    ExportResult all = IconExporter::exportSizes(master, ExportOptions{});
    assert(all.images.size() == IconExporter::allSizes().size());
    assert(all.images.count(1024) == 1 && all.images.count(100) == 1);

    std::atomic<bool> cancel{true};
    ExportResult cancelled = IconExporter::exportSizes(master, options, &cancel);
    assert(cancelled.cancelled);
    assert(cancelled.images.empty());

    options.sizes = {16, 0};
    bool threw = false;
    try {
        IconExporter::exportSizes(master, options);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    assert(IconExporter::sharpenParamsForSize(16)->percent == 150);
    assert(IconExporter::sharpenParamsForSize(64)->percent == 100);
    assert(!IconExporter::sharpenParamsForSize(128));

    // Non-square masters are padded, not stretched
    cv::Mat wide = IconExporter::renderSize(Filled(100, 50, kRed), 100);
    assert(wide.at<cv::Vec4b>(0, 50)[3] == 0);
    assert(wide.at<cv::Vec4b>(50, 50) == kRed);
}

static void TestImageOpsCompositingAndResize() {
    cv::Mat bottom = Filled(4, 4, kRed);
    cv::Mat opaqueTop = Filled(4, 4, kBlue);
    cv::Mat clearTop = Filled(4, 4, kClear);
    assert(SameImage(ImageOps::alphaComposite(bottom, opaqueTop), opaqueTop));
    assert(SameImage(ImageOps::alphaComposite(bottom, clearTop), bottom));

    cv::Mat half = ImageOps::alphaComposite(Filled(1, 1, kClear), Filled(1, 1, cv::Vec4b(0, 0, 255, 128)));
    assert(half.at<cv::Vec4b>(0, 0) == cv::Vec4b(0, 0, 255, 128));

    cv::Mat art = MakeArtwork(20, 20);
    assert(SameImage(ImageOps::resizeRGBA(art, art.size()), art));

    // Premultiplied resize keeps transparent neighbours from bleeding black into the edge
    cv::Mat edge = Filled(8, 8, kClear);
    FillRect(edge, cv::Rect(0, 0, 4, 8), kWhite);
    cv::Mat small = ImageOps::resizeRGBA(edge, cv::Size(3, 3));
    const cv::Vec4b mid = small.at<cv::Vec4b>(1, 1);
    assert(mid[3] > 0 && mid[3] < 255);
    assert(mid[0] == 255 && mid[1] == 255 && mid[2] == 255);
}

static void TestCApiEndToEnd() {
    IconForgeParams params;
    icon_forge_get_default_params(&params);
    assert(icon_forge_validate_params(&params) == ICON_FORGE_SUCCESS);
    assert(params.target_size == 1024);

    IconForgeParams bad = params;
    bad.target_size = 0;
    assert(icon_forge_validate_params(&bad) == ICON_FORGE_ERROR_INVALID_PARAMETERS);
    bad = params;
    bad.mask_mode = ICON_FORGE_MASK_COLOR_KEY;
    bad.color_keys[0].tolerance = 999;
    assert(icon_forge_validate_params(&bad) == ICON_FORGE_ERROR_INVALID_PARAMETERS);

    int32_t windows[ICON_FORGE_MAX_SIZES];
    assert(icon_forge_get_preset_sizes(ICON_FORGE_PRESET_WINDOWS, windows, ICON_FORGE_MAX_SIZES) == 4);
    assert(windows[0] == 16 && windows[3] == 256);
    assert(icon_forge_get_preset_sizes(42, windows, ICON_FORGE_MAX_SIZES) == -1);

    const auto dir = std::filesystem::temp_directory_path() / "iconforge_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    assert(!icon_forge_is_valid_image_file((dir / "missing.png").string().c_str()));
    assert(icon_forge_process_image_to_png_set((dir / "missing.png").string().c_str(), dir.string().c_str(),
                                               "x", nullptr, 0, &params, nullptr, nullptr, nullptr)
           == ICON_FORGE_ERROR_FILE_NOT_FOUND);

    const std::string input = (dir / "artwork.png").string();
    assert(cv::imwrite(input, ImageOps::toEncodable(MakeArtwork(64, 48))));
    assert(icon_forge_is_valid_image_file(input.c_str()));

    params.mask_mode = ICON_FORGE_MASK_BORDER_FLOOD;
    params.target_size = 64;
    params.binary_alpha_variant = true;
    const int32_t sizes[] = {16, 32};
    IconForgeResult result = icon_forge_process_image_to_png_set(
        input.c_str(), dir.string().c_str(), "app", sizes, 2, &params, nullptr, nullptr, nullptr);
    assert(result == ICON_FORGE_SUCCESS);
    assert(std::filesystem::exists(dir / "app_16x16.png"));
    assert(std::filesystem::exists(dir / "app_32x32.png"));
    assert(std::filesystem::exists(dir / "app_binary_32x32.png"));
    assert(!std::filesystem::exists(dir / "app_48x48.png"));

    cv::Mat written = cv::imread((dir / "app_32x32.png").string(), cv::IMREAD_UNCHANGED);
    assert(written.cols == 32 && written.channels() == 4);

    IconForgeAuditReport report;
    assert(icon_forge_audit_image((dir / "app_32x32.png").string().c_str(), &report, nullptr) == ICON_FORGE_SUCCESS);
    assert(report.issue_count >= 4);
    assert(std::string(report.issues[1].check_name) == "Resolution");
    assert(report.issues[1].severity == ICON_FORGE_SEVERITY_WARNING);
    icon_forge_free_audit_report(&report);
    assert(report.issues == nullptr);

    IconForgeMetrics metrics;
    assert(icon_forge_analyze_metrics(input.c_str(), &metrics, nullptr) == ICON_FORGE_SUCCESS);
    assert(metrics.palette_size == 3);

    IconForgeComparison comparison;
    assert(icon_forge_compare_to_reference(input.c_str(), input.c_str(), &comparison, nullptr) == ICON_FORGE_SUCCESS);
    assert(comparison.palette_diff == 0);
    assert(comparison.sharpness_diff == 0.0);

    assert(std::string(icon_forge_get_version()) == "1.0.0");
    assert(std::string(icon_forge_get_error_message(ICON_FORGE_ERROR_WRITE_FAILED)).find("write") != std::string::npos);

    std::filesystem::remove_all(dir);
}

static void TestCApiCancellationAndOutputDirectory() {
    const auto dir = std::filesystem::temp_directory_path() / "iconforge_cancel_test";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    const std::string input = (dir / "artwork.png").string();
    assert(cv::imwrite(input, ImageOps::toEncodable(MakeArtwork(64, 48))));

    IconForgeParams params;
    icon_forge_get_default_params(&params);
    params.target_size = 64;
    const int32_t sizes[] = {16, 32};

    // Missing nested output directories are created
    const auto nested = dir / "nested" / "out";
    assert(icon_forge_process_image_to_png_set(input.c_str(), nested.string().c_str(), "app", sizes, 2,
                                               &params, nullptr, nullptr, nullptr) == ICON_FORGE_SUCCESS);
    assert(std::filesystem::exists(nested / "app_16x16.png"));
    assert(std::filesystem::exists(nested / "app_32x32.png"));

    // A token cancelled up front stops the export before anything is written
    IconForgeCancelToken* token = icon_forge_create_cancel_token();
    assert(token != nullptr);
    icon_forge_cancel(token);
    const auto cancelledDir = dir / "cancelled";
    static IconForgeResult reported = ICON_FORGE_SUCCESS;
    IconForgeResult result = icon_forge_process_image_to_png_set(
        input.c_str(), cancelledDir.string().c_str(), "app", sizes, 2, &params, nullptr,
        [](IconForgeResult code, const char*) { reported = code; }, token);
    assert(result == ICON_FORGE_ERROR_CANCELLED);
    assert(reported == ICON_FORGE_ERROR_CANCELLED);
    assert(!std::filesystem::exists(cancelledDir / "app_16x16.png"));
    assert(!std::filesystem::exists(cancelledDir / "app_32x32.png"));
    icon_forge_destroy_cancel_token(token);
    icon_forge_destroy_cancel_token(nullptr);

    // An untouched token does not interfere
    token = icon_forge_create_cancel_token();
    assert(icon_forge_process_image_to_png_set(input.c_str(), dir.string().c_str(), "live", sizes, 2,
                                               &params, nullptr, nullptr, token) == ICON_FORGE_SUCCESS);
    assert(std::filesystem::exists(dir / "live_32x32.png"));
    icon_forge_destroy_cancel_token(token);

    assert(std::string(icon_forge_get_error_message(ICON_FORGE_ERROR_CANCELLED)).find("cancel") != std::string::npos);

    std::filesystem::remove_all(dir);
}

int main() {
    TestSpecConstructionRejectsBadRanges();
    TestMorphologyIdentityAndClosing();
    TestAutoCropIsIdempotent();
    TestCompositionIsAlwaysTargetSquare();
    TestCoverOfThinSourceRendersOnlyTheCanvas();
    TestBorderFloodUniformImageIsFullyRemoved();
    TestBorderFloodRemovesOnlyConnectedBorder();
    TestBorderFloodKeepsEnclosedBackground();
    TestEdgeProtectPadSavesFullBleedArt();
    TestColorKeysAreUnioned();
    TestOutsideStrokeRing();
    TestInsideAndCenterStroke();
    TestLiquidPolishZeroIsIdentity();
    TestEdgeRefinerRemovesDebris();
    TestCleanEdgesRampStartsAtThreshold();
    TestCornerSharpnessRoundsAndSharpens();
    TestResolutionSnapSharpensEdges();
    TestLiquidPolishRoundsCorners();
    TestMetricsOnTransparentAndFlatImages();
    TestAuditFlagsIssues();
    TestFixActionsAdjustSpec();
    TestPipelineIsDeterministic();
    TestPipelineHandlesDegenerateInputs();
    TestExportSizes();
    TestImageOpsCompositingAndResize();
    TestCApiEndToEnd();
    TestCApiCancellationAndOutputDirectory();
    return 0;
}
