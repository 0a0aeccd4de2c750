#include "IconSpecs.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std;

namespace IconForge {

namespace {

    void requireRange(const char* field, int value, int lo, int hi) {
        if (value < lo || value > hi) {
            throw invalid_argument(string(field) + " must be in [" + to_string(lo) + ", " +
                                   to_string(hi) + "], got " + to_string(value));
        }
    }

    void requireRange(const char* field, double value, double lo, double hi) {
        if (!std::isfinite(value) || value < lo || value > hi) {
            throw invalid_argument(string(field) + " must be in [" + to_string(lo) + ", " +
                                   to_string(hi) + "], got " + to_string(value));
        }
    }
}

ColorKey::ColorKey(Color color, int tolerance)
    : m_color(color), m_tolerance(tolerance) {
    requireRange("Color key tolerance", tolerance, 0, 255);
}

AutoCropMask::AutoCropMask(int padding)
    : m_padding(padding) {
    if (padding < 0) {
        throw invalid_argument("Crop padding cannot be negative, got " + to_string(padding));
    }
}

ColorKeyMask::ColorKeyMask(vector<ColorKey> keys, bool autoCropAfter)
    : m_keys(std::move(keys)), m_autoCropAfter(autoCropAfter) {
    if (m_keys.empty()) {
        throw invalid_argument("Color key masking requires at least one key color");
    }
}

BorderFloodMask::BorderFloodMask(int tolerance, SeedMode seedMode, bool autoCropAfter, bool edgeProtectPad)
    : m_tolerance(tolerance), m_seedMode(seedMode),
      m_autoCropAfter(autoCropAfter), m_edgeProtectPad(edgeProtectPad) {
    requireRange("Flood tolerance", tolerance, 0, 255);
}

CompositionSpec::CompositionSpec(FitMode fitMode, double scale, int targetSize)
    : m_fitMode(fitMode), m_scale(scale), m_targetSize(targetSize) {
    requireRange("Composition scale", scale, 0.5, 1.5);
    requireRange("Target size", targetSize, 1, kMaxTargetSize);
}

CompositionSpec CompositionSpec::safeMargin(int targetSize) {
    return CompositionSpec(FitMode::Contain, kSafeMarginScale, targetSize);
}

StrokeSpec::StrokeSpec(RGBAColor color, int widthPx, StrokeAlignment alignment)
    : m_color(color), m_widthPx(widthPx), m_alignment(alignment) {
    requireRange("Stroke width", widthPx, 1, 50);
}

MorphologySpec::MorphologySpec(int shapeWeight)
    : m_shapeWeight(shapeWeight) {
    requireRange("Shape weight", shapeWeight, -10, 10);
}

LiquidPolishSpec::LiquidPolishSpec(double intensity)
    : m_intensity(intensity) {
    requireRange("Liquid polish intensity", intensity, 0.0, 1.0);
}

EdgeRefineSpec::EdgeRefineSpec(int debrisThreshold, double smoothBlurRadius,
                               int cornerSharpness, int resolutionSnap)
    : m_debrisThreshold(debrisThreshold), m_smoothBlurRadius(smoothBlurRadius),
      m_cornerSharpness(cornerSharpness), m_resolutionSnap(resolutionSnap) {
    requireRange("Debris threshold", debrisThreshold, 0, 50);
    requireRange("Smooth blur radius", smoothBlurRadius, 0.0, 10.0);
    requireRange("Corner sharpness", cornerSharpness, 0, 100);
    requireRange("Resolution snap", resolutionSnap, 0, 100);
}

} // namespace IconForge
