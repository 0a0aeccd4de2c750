#include "IconForgeAPI.h"
#include "IconExporter.hpp"
#include "IconPipeline.hpp"
#include "QualityAuditor.hpp"
#include <opencv2/imgcodecs.hpp>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

using namespace IconForge;

struct IconForgeCancelToken {
    std::atomic<bool> cancelled{false};
};

// Internal helper functions
namespace {

    const char* kDebugOutputPath = "./debug/";

    // Convert C parameters to C++ specs; spec constructors throw on bad ranges
    PipelineSpec convertParams(const IconForgeParams* params) {
        PipelineSpec spec;

        switch (params->mask_mode) {
            case ICON_FORGE_MASK_NONE:
                spec.masking = NoMask{};
                break;
            case ICON_FORGE_MASK_AUTO_CROP:
                spec.masking = AutoCropMask(params->crop_padding);
                break;
            case ICON_FORGE_MASK_COLOR_KEY: {
                if (params->color_key_count < 1 || params->color_key_count > ICON_FORGE_MAX_COLOR_KEYS) {
                    throw std::invalid_argument("color_key_count must be in [1, " +
                                                std::to_string(ICON_FORGE_MAX_COLOR_KEYS) + "]");
                }
                std::vector<ColorKey> keys;
                for (int i = 0; i < params->color_key_count; i++) {
                    const IconForgeColorKey& k = params->color_keys[i];
                    keys.emplace_back(Color{k.r, k.g, k.b}, k.tolerance);
                }
                spec.masking = ColorKeyMask(std::move(keys), params->auto_crop_after);
                break;
            }
            case ICON_FORGE_MASK_BORDER_FLOOD:
                spec.masking = BorderFloodMask(params->flood_tolerance,
                                               params->flood_seed_all_edges ? SeedMode::AllEdges : SeedMode::Corners,
                                               params->auto_crop_after, params->edge_protect_pad);
                break;
            default:
                throw std::invalid_argument("Unknown mask_mode " + std::to_string(params->mask_mode));
        }

        if (params->fit_mode != ICON_FORGE_FIT_CONTAIN && params->fit_mode != ICON_FORGE_FIT_COVER) {
            throw std::invalid_argument("Unknown fit_mode " + std::to_string(params->fit_mode));
        }
        spec.composition = CompositionSpec(params->fit_mode == ICON_FORGE_FIT_COVER ? FitMode::Cover : FitMode::Contain,
                                           params->scale, params->target_size);

        spec.morphology = MorphologySpec(params->shape_weight);

        if (params->stroke_enabled) {
            StrokeAlignment alignment;
            switch (params->stroke_alignment) {
                case ICON_FORGE_STROKE_OUTSIDE: alignment = StrokeAlignment::Outside; break;
                case ICON_FORGE_STROKE_CENTER: alignment = StrokeAlignment::Center; break;
                case ICON_FORGE_STROKE_INSIDE: alignment = StrokeAlignment::Inside; break;
                default:
                    throw std::invalid_argument("Unknown stroke_alignment " + std::to_string(params->stroke_alignment));
            }
            RGBAColor color{params->stroke_color[0], params->stroke_color[1],
                            params->stroke_color[2], params->stroke_color[3]};
            spec.stroke = StrokeSpec(color, params->stroke_width, alignment);
        }

        spec.liquidPolish = LiquidPolishSpec(params->liquid_polish_intensity);
        spec.edgeRefine = EdgeRefineSpec(params->debris_threshold, params->smooth_blur_radius,
                                         params->corner_sharpness, params->resolution_snap);

        if (params->thread_limit < 0) {
            throw std::invalid_argument("thread_limit cannot be negative");
        }
        return spec;
    }

    void convertMetrics(const QualityMetrics& metrics, IconForgeMetrics* out) {
        out->sharpness = metrics.sharpness;
        out->contrast = metrics.contrast;
        out->brightness = metrics.brightness;
        out->palette_size = metrics.paletteSize;
    }

    void copyText(char* dst, size_t capacity, const std::string& src) {
        std::snprintf(dst, capacity, "%s", src.c_str());
    }

    // Convert C++ exception to error code
    IconForgeResult handleException(const std::exception& e, IconForgeErrorCallback error_callback) {
        IconForgeResult code = ICON_FORGE_ERROR_PROCESSING_FAILED;
        std::string what = e.what();
        if (dynamic_cast<const std::invalid_argument*>(&e)) {
            code = ICON_FORGE_ERROR_INVALID_PARAMETERS;
        } else if (dynamic_cast<const std::filesystem::filesystem_error*>(&e)) {
            code = ICON_FORGE_ERROR_WRITE_FAILED;
        } else if (what.find("Failed to load image") != std::string::npos) {
            code = ICON_FORGE_ERROR_IMAGE_LOAD_FAILED;
        }

        if (error_callback) {
            error_callback(code, e.what());
        }
        return code;
    }

    // Progress reporting helper
    void reportProgress(IconForgeProgressCallback callback, double progress, const char* stage) {
        if (callback) {
            callback(progress, stage);
        }
    }

    bool fileReadable(const char* path, IconForgeErrorCallback error_callback) {
        if (std::ifstream(path).good()) {
            return true;
        }
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_FILE_NOT_FOUND, "Input file not found or not readable");
        }
        return false;
    }
}

// API Implementation

void icon_forge_get_default_params(IconForgeParams* params) {
    if (!params) return;

    std::memset(params, 0, sizeof(*params));

    // Masking: off; color key defaults to a white background key
    params->mask_mode = ICON_FORGE_MASK_NONE;
    params->crop_padding = kAutoCropAfterPadding;
    params->color_keys[0] = IconForgeColorKey{255, 255, 255, 30};
    params->color_key_count = 1;
    params->auto_crop_after = true;
    params->flood_tolerance = 30;
    params->flood_seed_all_edges = false;
    params->edge_protect_pad = false;

    // Composition: whole image on a 1024 canvas
    params->fit_mode = ICON_FORGE_FIT_CONTAIN;
    params->scale = 1.0;
    params->target_size = CompositionSpec::kDefaultTargetSize;

    params->shape_weight = 0;

    params->stroke_enabled = false;
    params->stroke_color[0] = 255;
    params->stroke_color[1] = 255;
    params->stroke_color[2] = 255;
    params->stroke_color[3] = 255;
    params->stroke_width = 4;
    params->stroke_alignment = ICON_FORGE_STROKE_OUTSIDE;

    // Edge cleanup
    params->liquid_polish_intensity = 0.0;
    params->debris_threshold = 10;
    params->smooth_blur_radius = 0.3;
    params->corner_sharpness = 50;
    params->resolution_snap = 0;

    params->binary_alpha_variant = false;
    params->thread_limit = 0;

    // Debug settings
    params->enable_debug_output = false;
    params->verbose_output = false;
}

IconForgeResult icon_forge_validate_params(const IconForgeParams* params) {
    if (!params) return ICON_FORGE_ERROR_INVALID_PARAMETERS;

    try {
        convertParams(params);
    } catch (const std::invalid_argument& e) {
        if (params->verbose_output) {
            std::cerr << "[ERROR] Invalid parameters: " << e.what() << std::endl;
        }
        return ICON_FORGE_ERROR_INVALID_PARAMETERS;
    }
    return ICON_FORGE_SUCCESS;
}

IconForgeResult icon_forge_process_image_to_png_set(
    const char* input_path,
    const char* output_dir,
    const char* icon_name,
    const int32_t* sizes,
    int32_t size_count,
    const IconForgeParams* params,
    IconForgeProgressCallback progress_callback,
    IconForgeErrorCallback error_callback,
    IconForgeCancelToken* cancel_token
) {
    if (!input_path || !output_dir || !icon_name || icon_name[0] == '\0' ||
        size_count < 0 || size_count > ICON_FORGE_MAX_SIZES || (size_count > 0 && !sizes)) {
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return ICON_FORGE_ERROR_INVALID_INPUT;
    }

    if (!fileReadable(input_path, error_callback)) {
        return ICON_FORGE_ERROR_FILE_NOT_FOUND;
    }

    IconForgeParams default_params;
    if (!params) {
        icon_forge_get_default_params(&default_params);
        params = &default_params;
    }

    const std::atomic<bool>* cancelFlag = cancel_token ? &cancel_token->cancelled : nullptr;
    auto reportCancelled = [error_callback]() {
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_CANCELLED, "Export cancelled, no files written");
        }
        return ICON_FORGE_ERROR_CANCELLED;
    };

    try {
        reportProgress(progress_callback, 0.0, "Validating parameters");
        PipelineSpec spec = convertParams(params);
        if (cancelFlag && cancelFlag->load()) {
            return reportCancelled();
        }

        reportProgress(progress_callback, 0.1, "Loading image");
        cv::Mat source = IconPipeline::loadImage(input_path);

        IconPipeline::PipelineOptions options;
        options.verboseOutput = params->verbose_output;
        if (params->enable_debug_output) {
            std::filesystem::create_directories(kDebugOutputPath);
            auto counter = std::make_shared<int>(0);
            options.stageCallback = [counter](const std::string& stage, const cv::Mat& image) {
                char prefix[8];
                std::snprintf(prefix, sizeof(prefix), "%02d_", ++*counter);
                const std::string fullPath = std::string(kDebugOutputPath) + prefix + stage + ".png";
                if (IconPipeline::saveImage(fullPath, image)) {
                    std::cout << "[DEBUG] Saved debug image: " << fullPath << std::endl;
                } else {
                    std::cout << "[WARN] Failed to save debug image: " << fullPath << std::endl;
                }
            };
        }

        reportProgress(progress_callback, 0.2, "Masking and composing");
        cv::Mat master = IconPipeline::process(source, spec, options);

        if (params->verbose_output) {
            for (const AuditIssue& issue : QualityAuditor::actionableIssues(QualityAuditor::auditImage(master))) {
                std::cout << "[WARN] " << issue.checkName << ": " << issue.message << std::endl;
            }
        }

        reportProgress(progress_callback, 0.5, "Rendering icon sizes");
        ExportOptions exportOptions;
        if (size_count > 0) {
            exportOptions.sizes.assign(sizes, sizes + size_count);
        }
        exportOptions.threadLimit = static_cast<unsigned int>(params->thread_limit);
        exportOptions.binaryAlpha = params->binary_alpha_variant;
        exportOptions.verboseOutput = params->verbose_output;
        ExportResult exported = IconExporter::exportSizes(master, exportOptions, cancelFlag);
        if (exported.cancelled) {
            return reportCancelled();
        }

        reportProgress(progress_callback, 0.8, "Writing PNG set");
        const std::filesystem::path dir(output_dir);
        std::filesystem::create_directories(dir);
        for (const auto& [size, image] : exported.images) {
            const std::string dims = std::to_string(size) + "x" + std::to_string(size);
            const std::string path = (dir / (std::string(icon_name) + "_" + dims + ".png")).string();
            bool written = IconPipeline::saveImage(path, image);

            auto binary = exported.binaryAlphaImages.find(size);
            if (written && binary != exported.binaryAlphaImages.end()) {
                const std::string binaryPath = (dir / (std::string(icon_name) + "_binary_" + dims + ".png")).string();
                written = IconPipeline::saveImage(binaryPath, binary->second);
            }
            if (!written) {
                if (error_callback) {
                    error_callback(ICON_FORGE_ERROR_WRITE_FAILED, ("Failed to write " + path).c_str());
                }
                return ICON_FORGE_ERROR_WRITE_FAILED;
            }
        }

        reportProgress(progress_callback, 1.0, "Icon set complete");
        return ICON_FORGE_SUCCESS;

    } catch (const std::exception& e) {
        return handleException(e, error_callback);
    }
}

IconForgeResult icon_forge_audit_image(
    const char* image_path,
    IconForgeAuditReport* report,
    IconForgeErrorCallback error_callback
) {
    if (!image_path || !report) {
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return ICON_FORGE_ERROR_INVALID_INPUT;
    }

    report->issues = nullptr;
    report->issue_count = 0;

    if (!fileReadable(image_path, error_callback)) {
        return ICON_FORGE_ERROR_FILE_NOT_FOUND;
    }

    try {
        std::vector<AuditIssue> issues = QualityAuditor::auditImage(IconPipeline::loadImage(image_path));
        if (issues.empty()) {
            return ICON_FORGE_SUCCESS;
        }

        report->issues = static_cast<IconForgeAuditIssue*>(calloc(issues.size(), sizeof(IconForgeAuditIssue)));
        if (!report->issues) {
            throw std::runtime_error("Out of memory allocating audit report");
        }
        report->issue_count = static_cast<int32_t>(issues.size());

        for (size_t i = 0; i < issues.size(); i++) {
            IconForgeAuditIssue& out = report->issues[i];
            copyText(out.check_name, sizeof(out.check_name), issues[i].checkName);
            out.severity = static_cast<int32_t>(issues[i].severity);
            copyText(out.message, sizeof(out.message), issues[i].message);
            copyText(out.fix_action, sizeof(out.fix_action),
                     issues[i].fixAction ? QualityAuditor::fixActionTag(*issues[i].fixAction) : "");
        }
        return ICON_FORGE_SUCCESS;

    } catch (const std::exception& e) {
        icon_forge_free_audit_report(report);
        return handleException(e, error_callback);
    }
}

IconForgeResult icon_forge_analyze_metrics(
    const char* image_path,
    IconForgeMetrics* metrics,
    IconForgeErrorCallback error_callback
) {
    if (!image_path || !metrics) {
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return ICON_FORGE_ERROR_INVALID_INPUT;
    }

    if (!fileReadable(image_path, error_callback)) {
        return ICON_FORGE_ERROR_FILE_NOT_FOUND;
    }

    try {
        convertMetrics(QualityAuditor::analyzeMetrics(IconPipeline::loadImage(image_path)), metrics);
        return ICON_FORGE_SUCCESS;
    } catch (const std::exception& e) {
        return handleException(e, error_callback);
    }
}

IconForgeResult icon_forge_compare_to_reference(
    const char* image_path,
    const char* reference_path,
    IconForgeComparison* comparison,
    IconForgeErrorCallback error_callback
) {
    if (!image_path || !reference_path || !comparison) {
        if (error_callback) {
            error_callback(ICON_FORGE_ERROR_INVALID_INPUT, "Invalid input parameters");
        }
        return ICON_FORGE_ERROR_INVALID_INPUT;
    }

    if (!fileReadable(image_path, error_callback) || !fileReadable(reference_path, error_callback)) {
        return ICON_FORGE_ERROR_FILE_NOT_FOUND;
    }

    try {
        MetricsComparison result = QualityAuditor::compareToReference(
            IconPipeline::loadImage(image_path), IconPipeline::loadImage(reference_path));

        convertMetrics(result.yours, &comparison->yours);
        convertMetrics(result.reference, &comparison->reference);
        comparison->sharpness_diff = result.sharpnessDiff;
        comparison->contrast_diff = result.contrastDiff;
        comparison->brightness_diff = result.brightnessDiff;
        comparison->palette_diff = result.paletteDiff;
        return ICON_FORGE_SUCCESS;
    } catch (const std::exception& e) {
        return handleException(e, error_callback);
    }
}

int32_t icon_forge_get_preset_sizes(int32_t preset, int32_t* sizes, int32_t capacity) {
    const std::vector<int>* preset_sizes = nullptr;
    switch (preset) {
        case ICON_FORGE_PRESET_WINDOWS: preset_sizes = &IconExporter::windowsSizes(); break;
        case ICON_FORGE_PRESET_MAC: preset_sizes = &IconExporter::macSizes(); break;
        case ICON_FORGE_PRESET_WEB: preset_sizes = &IconExporter::webSizes(); break;
        case ICON_FORGE_PRESET_ALL: preset_sizes = &IconExporter::allSizes(); break;
        default: return -1;
    }

    const int32_t count = static_cast<int32_t>(preset_sizes->size());
    if (sizes) {
        for (int32_t i = 0; i < count && i < capacity; i++) {
            sizes[i] = (*preset_sizes)[i];
        }
    }
    return count;
}

IconForgeCancelToken* icon_forge_create_cancel_token(void) {
    return new (std::nothrow) IconForgeCancelToken();
}

void icon_forge_cancel(IconForgeCancelToken* token) {
    if (token) {
        token->cancelled.store(true);
    }
}

void icon_forge_destroy_cancel_token(IconForgeCancelToken* token) {
    delete token;
}

void icon_forge_free_audit_report(IconForgeAuditReport* report) {
    if (report && report->issues) {
        free(report->issues);
        report->issues = nullptr;
        report->issue_count = 0;
    }
}

const char* icon_forge_get_error_message(IconForgeResult error_code) {
    switch (error_code) {
        case ICON_FORGE_SUCCESS: return "Success";
        case ICON_FORGE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case ICON_FORGE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case ICON_FORGE_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case ICON_FORGE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case ICON_FORGE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        case ICON_FORGE_ERROR_WRITE_FAILED: return "Failed to write output image - check output directory permissions";
        case ICON_FORGE_ERROR_CANCELLED: return "Export was cancelled";
        default: return "Unknown error";
    }
}

const char* icon_forge_get_version(void) {
    return "1.0.0";
}

bool icon_forge_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        return cv::haveImageReader(file_path) && !cv::imread(file_path, cv::IMREAD_UNCHANGED).empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] Could not probe " << file_path << ": " << e.what() << std::endl;
        return false;
    }
}
