#pragma once

#include "IconSpecs.hpp"
#include "QualityAuditor.hpp"
#include <opencv2/core.hpp>
#include <functional>
#include <string>

namespace IconForge {

enum class PipelineStage {
    Masked = 1,
    Composed = 2,
    Shaped = 3,
    Stroked = 4,
    Polished = 5,
    Refined = 6
};

class IconPipeline {
public:
    // Called after every stage that ran, with the stage name and its output
    using StageCallback = std::function<void(const std::string& stage, const cv::Mat& image)>;

    struct PipelineOptions {
        bool verboseOutput = false;
        StageCallback stageCallback;
    };

    // Boundary helpers: OpenCV decode/encode with BGR(A) <-> RGBA conversion
    static cv::Mat loadImage(const std::string& path);
    static bool saveImage(const std::string& path, const cv::Mat& rgba);

    static cv::Mat applyMasking(const cv::Mat& rgba, const MaskingSpec& masking);

    /**
     * Run the full chain: masking -> composition -> shape weight -> stroke ->
     * liquid polish -> edge refinement. The source is never modified and the
     * same bytes with the same spec always give the same output.
     *
     * @throws std::invalid_argument when the source is empty or not 8-bit
     */
    static cv::Mat process(const cv::Mat& source, const PipelineSpec& spec,
                           const PipelineOptions& options);
    static cv::Mat process(const cv::Mat& source, const PipelineSpec& spec);

    // Same chain, stopping after `targetStage`
    static cv::Mat processToStage(const cv::Mat& source, const PipelineSpec& spec,
                                  PipelineStage targetStage, const PipelineOptions& options);

    // Spec adjusted the way an audit fix action asks for
    static PipelineSpec applyFix(const PipelineSpec& spec, FixAction action);

    static const char* stageName(PipelineStage stage);
};

} // namespace IconForge
