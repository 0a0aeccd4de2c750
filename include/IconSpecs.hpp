#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace IconForge {

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

struct RGBAColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

// A key color plus the per-channel distance (0-255) still counted as a match
class ColorKey {
public:
    ColorKey(Color color, int tolerance);

    Color color() const { return m_color; }
    int tolerance() const { return m_tolerance; }

private:
    Color m_color;
    int m_tolerance;
};

enum class SeedMode {
    Corners,
    AllEdges
};

enum class FitMode {
    Contain,
    Cover
};

enum class StrokeAlignment {
    Outside,
    Center,
    Inside
};

// Padding applied by the crop that optionally follows color-key / border-flood masking
constexpr int kAutoCropAfterPadding = 5;

// Transparent border added before flooding when edge protection is on
constexpr int kEdgeProtectPadding = 5;

// Masking modes. Exactly one is active per pipeline run.
struct NoMask {};

class AutoCropMask {
public:
    explicit AutoCropMask(int padding = kAutoCropAfterPadding);

    int padding() const { return m_padding; }

private:
    int m_padding;
};

class ColorKeyMask {
public:
    ColorKeyMask(std::vector<ColorKey> keys, bool autoCropAfter);

    const std::vector<ColorKey>& keys() const { return m_keys; }
    bool autoCropAfter() const { return m_autoCropAfter; }

private:
    std::vector<ColorKey> m_keys;
    bool m_autoCropAfter;
};

class BorderFloodMask {
public:
    BorderFloodMask(int tolerance, SeedMode seedMode, bool autoCropAfter, bool edgeProtectPad);

    int tolerance() const { return m_tolerance; }
    SeedMode seedMode() const { return m_seedMode; }
    bool autoCropAfter() const { return m_autoCropAfter; }
    bool edgeProtectPad() const { return m_edgeProtectPad; }

private:
    int m_tolerance;
    SeedMode m_seedMode;
    bool m_autoCropAfter;
    bool m_edgeProtectPad;
};

using MaskingSpec = std::variant<NoMask, AutoCropMask, ColorKeyMask, BorderFloodMask>;

class CompositionSpec {
public:
    static constexpr double kSafeMarginScale = 0.9;
    static constexpr int kDefaultTargetSize = 1024;
    static constexpr int kMaxTargetSize = 16384;

    CompositionSpec(FitMode fitMode = FitMode::Contain, double scale = 1.0,
                    int targetSize = kDefaultTargetSize);

    // "Safe Margin" preset: contain fit shrunk to 90%
    static CompositionSpec safeMargin(int targetSize = kDefaultTargetSize);

    FitMode fitMode() const { return m_fitMode; }
    double scale() const { return m_scale; }
    int targetSize() const { return m_targetSize; }

private:
    FitMode m_fitMode;
    double m_scale;
    int m_targetSize;
};

class StrokeSpec {
public:
    StrokeSpec(RGBAColor color, int widthPx, StrokeAlignment alignment = StrokeAlignment::Outside);

    RGBAColor color() const { return m_color; }
    int widthPx() const { return m_widthPx; }
    StrokeAlignment alignment() const { return m_alignment; }

private:
    RGBAColor m_color;
    int m_widthPx;
    StrokeAlignment m_alignment;
};

// Negative weight chokes (erodes) the shape, positive weight expands it
class MorphologySpec {
public:
    explicit MorphologySpec(int shapeWeight = 0);

    int shapeWeight() const { return m_shapeWeight; }

private:
    int m_shapeWeight;
};

class LiquidPolishSpec {
public:
    explicit LiquidPolishSpec(double intensity = 0.0);

    double intensity() const { return m_intensity; }
    bool enabled() const { return m_intensity > 0.0; }

private:
    double m_intensity;
};

class EdgeRefineSpec {
public:
    EdgeRefineSpec(int debrisThreshold = 10, double smoothBlurRadius = 0.3,
                   int cornerSharpness = 50, int resolutionSnap = 0);

    int debrisThreshold() const { return m_debrisThreshold; }
    double smoothBlurRadius() const { return m_smoothBlurRadius; }
    int cornerSharpness() const { return m_cornerSharpness; }
    int resolutionSnap() const { return m_resolutionSnap; }

private:
    int m_debrisThreshold;
    double m_smoothBlurRadius;
    int m_cornerSharpness;
    int m_resolutionSnap;
};

// The full parameter set for one pipeline run
struct PipelineSpec {
    MaskingSpec masking = NoMask{};
    CompositionSpec composition;
    MorphologySpec morphology;
    std::optional<StrokeSpec> stroke;
    LiquidPolishSpec liquidPolish;
    EdgeRefineSpec edgeRefine;
};

} // namespace IconForge
