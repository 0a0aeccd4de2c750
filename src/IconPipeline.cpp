#include "IconPipeline.hpp"
#include "AlphaMorphology.hpp"
#include "AutoCropper.hpp"
#include "BorderFloodMasker.hpp"
#include "CompositionEngine.hpp"
#include "ContentMasker.hpp"
#include "EdgeRefiner.hpp"
#include "ImageOps.hpp"
#include "LiquidPolisher.hpp"
#include "StrokeGenerator.hpp"
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <type_traits>

using namespace cv;
using namespace std;

namespace IconForge {

namespace {

    void reportStage(const IconPipeline::PipelineOptions& options, PipelineStage stage, const Mat& image) {
        if (options.verboseOutput) {
            cout << "[INFO] Stage " << static_cast<int>(stage) << " (" << IconPipeline::stageName(stage)
                 << ") -> " << image.cols << " x " << image.rows << endl;
        }
        if (options.stageCallback) {
            options.stageCallback(IconPipeline::stageName(stage), image);
        }
    }

    const char* seedModeName(SeedMode mode) {
        return mode == SeedMode::Corners ? "corners" : "all edges";
    }
}

Mat IconPipeline::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    Mat decoded = imread(path, IMREAD_UNCHANGED);
    if (decoded.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        throw runtime_error("Failed to load image: " + path);
    }
    return ImageOps::fromDecoded(decoded);
}

bool IconPipeline::saveImage(const string& path, const Mat& rgba) {
    if (rgba.empty()) {
        cerr << "[ERROR] Refusing to write empty image to " << path << endl;
        return false;
    }
    if (!imwrite(path, ImageOps::toEncodable(rgba))) {
        cerr << "[ERROR] Failed to write image: " << path << endl;
        return false;
    }
    return true;
}

Mat IconPipeline::applyMasking(const Mat& rgba, const MaskingSpec& masking) {
    return std::visit([&rgba](const auto& mode) -> Mat {
        using Mode = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<Mode, AutoCropMask>) {
            return AutoCropper::cropToContent(rgba, mode.padding());
        } else if constexpr (std::is_same_v<Mode, ColorKeyMask>) {
            return ContentMasker::apply(rgba, mode);
        } else if constexpr (std::is_same_v<Mode, BorderFloodMask>) {
            return BorderFloodMasker::apply(rgba, mode);
        } else {
            return rgba.clone();
        }
    }, masking);
}

Mat IconPipeline::process(const Mat& source, const PipelineSpec& spec, const PipelineOptions& options) {
    return processToStage(source, spec, PipelineStage::Refined, options);
}

Mat IconPipeline::process(const Mat& source, const PipelineSpec& spec) {
    return process(source, spec, PipelineOptions{});
}

Mat IconPipeline::processToStage(const Mat& source, const PipelineSpec& spec,
                                 PipelineStage targetStage, const PipelineOptions& options) {
    if (source.empty()) {
        throw invalid_argument("Source image is empty");
    }

    Mat img = ImageOps::ensureRGBA(source);
    if (options.verboseOutput) {
        cout << "[INFO] Processing " << img.cols << " x " << img.rows << " source" << endl;
        if (const auto* flood = std::get_if<BorderFloodMask>(&spec.masking)) {
            cout << "[INFO] Border flood masking from " << seedModeName(flood->seedMode())
                 << ", tolerance " << flood->tolerance() << endl;
        }
    }

    // Stage 1: masking (mutually exclusive modes)
    img = applyMasking(img, spec.masking);
    reportStage(options, PipelineStage::Masked, img);
    if (targetStage == PipelineStage::Masked) {
        return img;
    }

    // Stage 2: square canvas
    img = CompositionEngine::compose(img, spec.composition);
    reportStage(options, PipelineStage::Composed, img);
    if (targetStage == PipelineStage::Composed) {
        return img;
    }

    // Stage 3: shape weight
    img = AlphaMorphology::applyShapeWeight(img, spec.morphology.shapeWeight());
    reportStage(options, PipelineStage::Shaped, img);
    if (targetStage == PipelineStage::Shaped) {
        return img;
    }

    // Stage 4: stroke (if enabled)
    if (spec.stroke) {
        img = StrokeGenerator::apply(img, *spec.stroke);
        reportStage(options, PipelineStage::Stroked, img);
    }
    if (targetStage == PipelineStage::Stroked) {
        return img;
    }

    // Stage 5: liquid polish (if enabled)
    if (spec.liquidPolish.enabled()) {
        img = LiquidPolisher::apply(img, spec.liquidPolish);
        reportStage(options, PipelineStage::Polished, img);
    }
    if (targetStage == PipelineStage::Polished) {
        return img;
    }

    // Stage 6: debris cleanup, corner sharpness, resolution snap
    img = EdgeRefiner::refine(img, spec.edgeRefine);
    reportStage(options, PipelineStage::Refined, img);
    return img;
}

PipelineSpec IconPipeline::applyFix(const PipelineSpec& spec, FixAction action) {
    PipelineSpec fixed = spec;
    const EdgeRefineSpec& edge = spec.edgeRefine;

    switch (action) {
        case FixAction::SmartCleanup:
            fixed.edgeRefine = EdgeRefineSpec(edge.debrisThreshold(), 0.1, 80, edge.resolutionSnap());
            break;
        case FixAction::Sharpen:
            fixed.edgeRefine = EdgeRefineSpec(edge.debrisThreshold(), edge.smoothBlurRadius(),
                                              edge.cornerSharpness(), std::max(edge.resolutionSnap(), 50));
            break;
        case FixAction::CleanDebris:
            fixed.edgeRefine = EdgeRefineSpec(std::max(edge.debrisThreshold(), 10), edge.smoothBlurRadius(),
                                              edge.cornerSharpness(), edge.resolutionSnap());
            break;
        case FixAction::CropSquare:
            fixed.composition = CompositionSpec(FitMode::Cover, spec.composition.scale(),
                                                spec.composition.targetSize());
            break;
    }
    return fixed;
}

const char* IconPipeline::stageName(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Masked: return "masked";
        case PipelineStage::Composed: return "composed";
        case PipelineStage::Shaped: return "shaped";
        case PipelineStage::Stroked: return "stroked";
        case PipelineStage::Polished: return "polished";
        case PipelineStage::Refined: return "refined";
    }
    return "unknown";
}

} // namespace IconForge
