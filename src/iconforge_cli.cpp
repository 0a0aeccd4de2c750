#include <IconForgeAPI.h>
#include <iostream>
#include <string>
#include <sstream>
#include <fstream>
#include <stdexcept>
#include <vector>

using namespace std;

struct Arguments {
    string inputPath;
    string outputDir = ".";
    string iconName;
    bool valid = false;
    bool verbose = false;
    bool debug = false;

    // Export sizes (empty = every preset size)
    vector<int32_t> sizes;
    bool binaryAlpha = false;
    int threads = 0;

    // Masking
    string maskMode = "none";
    int cropPadding = 5;
    vector<IconForgeColorKey> keys;
    int floodTolerance = 30;
    bool seedAllEdges = false;
    bool autoCropAfter = true;
    bool edgePad = false;

    // Composition
    bool cover = false;
    double scale = 1.0;
    int targetSize = 1024;

    int shapeWeight = 0;

    // Stroke
    bool strokeEnabled = false;
    uint32_t strokeColor = 0xFFFFFFFF;  // RRGGBBAA
    int strokeWidth = 4;
    string strokeAlign = "outside";

    // Edge cleanup
    double liquidPolish = 0.0;
    int debrisThreshold = 10;
    double smoothBlur = 0.3;
    int cornerSharpness = 50;
    int resolutionSnap = 0;

    // Inspection only
    bool auditOnly = false;
    string referencePath;
};

namespace {

    // RRGGBB or RRGGBBAA, optional leading '#'
    uint32_t parseHexColor(string hex) {
        if (!hex.empty() && hex[0] == '#') {
            hex = hex.substr(1);
        }
        if (hex.size() != 6 && hex.size() != 8) {
            throw invalid_argument("Color must be RRGGBB or RRGGBBAA: " + hex);
        }
        uint32_t value = static_cast<uint32_t>(stoul(hex, nullptr, 16));
        return hex.size() == 6 ? (value << 8) | 0xFF : value;
    }

    // RRGGBB[:tolerance]
    IconForgeColorKey parseColorKey(const string& text, int defaultTolerance) {
        size_t colon = text.find(':');
        uint32_t rgba = parseHexColor(text.substr(0, colon));
        IconForgeColorKey key;
        key.r = static_cast<uint8_t>(rgba >> 24);
        key.g = static_cast<uint8_t>(rgba >> 16);
        key.b = static_cast<uint8_t>(rgba >> 8);
        key.tolerance = colon == string::npos ? defaultTolerance : stoi(text.substr(colon + 1));
        return key;
    }

    vector<int32_t> presetSizes(int32_t preset) {
        vector<int32_t> sizes(ICON_FORGE_MAX_SIZES);
        int32_t count = icon_forge_get_preset_sizes(preset, sizes.data(), ICON_FORGE_MAX_SIZES);
        sizes.resize(count > 0 ? count : 0);
        return sizes;
    }

    // "windows", "mac", "web", "all" or a comma list like 16,32,48
    vector<int32_t> parseSizes(const string& text) {
        if (text == "windows") return presetSizes(ICON_FORGE_PRESET_WINDOWS);
        if (text == "mac") return presetSizes(ICON_FORGE_PRESET_MAC);
        if (text == "web") return presetSizes(ICON_FORGE_PRESET_WEB);
        if (text == "all") return presetSizes(ICON_FORGE_PRESET_ALL);

        vector<int32_t> sizes;
        stringstream ss(text);
        string item;
        while (getline(ss, item, ',')) {
            if (!item.empty()) {
                sizes.push_back(stoi(item));
            }
        }
        return sizes;
    }

    string fileStem(const string& path) {
        size_t slash = path.find_last_of("/\\");
        string name = slash == string::npos ? path : path.substr(slash + 1);
        size_t dotPos = name.find_last_of('.');
        return dotPos == string::npos ? name : name.substr(0, dotPos);
    }
}

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if ((arg == "-o" || arg == "--output-dir") && (i + 1 < argc)) {
            args.outputDir = argv[++i];
        } else if ((arg == "-n" || arg == "--name") && (i + 1 < argc)) {
            args.iconName = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if ((arg == "--sizes") && (i + 1 < argc)) {
            args.sizes = parseSizes(argv[++i]);
        } else if (arg == "--binary-alpha") {
            args.binaryAlpha = true;
        } else if ((arg == "--threads") && (i + 1 < argc)) {
            args.threads = stoi(argv[++i]);
        } else if ((arg == "--mask") && (i + 1 < argc)) {
            args.maskMode = argv[++i];
        } else if ((arg == "--padding") && (i + 1 < argc)) {
            args.cropPadding = stoi(argv[++i]);
        } else if ((arg == "--key") && (i + 1 < argc)) {
            args.keys.push_back(parseColorKey(argv[++i], args.floodTolerance));
        } else if ((arg == "--tolerance") && (i + 1 < argc)) {
            args.floodTolerance = stoi(argv[++i]);
        } else if ((arg == "--seed") && (i + 1 < argc)) {
            string seed = argv[++i];
            if (seed != "corners" && seed != "edges") {
                throw invalid_argument("--seed must be corners or edges");
            }
            args.seedAllEdges = seed == "edges";
        } else if (arg == "--autocrop-after") {
            args.autoCropAfter = true;
        } else if (arg == "--no-autocrop-after") {
            args.autoCropAfter = false;
        } else if (arg == "--edge-pad") {
            args.edgePad = true;
        } else if ((arg == "--fit") && (i + 1 < argc)) {
            string fit = argv[++i];
            if (fit != "contain" && fit != "cover") {
                throw invalid_argument("--fit must be contain or cover");
            }
            args.cover = fit == "cover";
        } else if ((arg == "--scale") && (i + 1 < argc)) {
            args.scale = stod(argv[++i]);
        } else if (arg == "--safe-margin") {
            args.scale = 0.9;
        } else if ((arg == "--target-size") && (i + 1 < argc)) {
            args.targetSize = stoi(argv[++i]);
        } else if ((arg == "--shape-weight") && (i + 1 < argc)) {
            args.shapeWeight = stoi(argv[++i]);
        } else if ((arg == "--stroke-color") && (i + 1 < argc)) {
            args.strokeColor = parseHexColor(argv[++i]);
            args.strokeEnabled = true;
        } else if ((arg == "--stroke-width") && (i + 1 < argc)) {
            args.strokeWidth = stoi(argv[++i]);
            args.strokeEnabled = true;
        } else if ((arg == "--stroke-align") && (i + 1 < argc)) {
            args.strokeAlign = argv[++i];
            args.strokeEnabled = true;
        } else if ((arg == "--liquid-polish") && (i + 1 < argc)) {
            args.liquidPolish = stod(argv[++i]);
        } else if ((arg == "--debris-threshold") && (i + 1 < argc)) {
            args.debrisThreshold = stoi(argv[++i]);
        } else if ((arg == "--smooth") && (i + 1 < argc)) {
            args.smoothBlur = stod(argv[++i]);
        } else if ((arg == "--corner-sharpness") && (i + 1 < argc)) {
            args.cornerSharpness = stoi(argv[++i]);
        } else if ((arg == "--resolution-snap") && (i + 1 < argc)) {
            args.resolutionSnap = stoi(argv[++i]);
        } else if (arg == "--audit") {
            args.auditOnly = true;
        } else if ((arg == "--reference") && (i + 1 < argc)) {
            args.referencePath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        } else {
            throw invalid_argument("Unknown or incomplete option: " + arg);
        }
    }

    if (args.inputPath.empty()) {
        return args;
    }

    if (args.iconName.empty()) {
        args.iconName = fileStem(args.inputPath);
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "IconForge CLI - Turn artwork into clean, multi-size app icons\n"
         << "Using libiconforge v" << icon_forge_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-o <output_dir>] [-n <name>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Output:\n"
         << "  -o, --output-dir <dir>  Directory for the PNG set (default: .)\n"
         << "  -n, --name <name>  File name stem (default: input file name)\n"
         << "  --sizes <list>  windows, mac, web, all or e.g. 16,32,48 (default: all)\n"
         << "  --binary-alpha  Also write <name>_binary_<N>x<N>.png with hard alpha\n"
         << "  --threads <n>  Export worker limit, 0 = auto (default: 0)\n"
         << "\n"
         << "Masking:\n"
         << "  --mask <none|crop|key|flood>  Masking mode (default: none)\n"
         << "  --padding <px>  Padding kept by --mask crop (default: 5)\n"
         << "  --key <RRGGBB[:tol]>  Background color key, repeatable (default: FFFFFF)\n"
         << "  --tolerance <0-255>  Flood tolerance and default key tolerance (default: 30)\n"
         << "  --seed <corners|edges>  Flood seeds (default: corners)\n"
         << "  --no-autocrop-after  Keep the full frame after key/flood masking\n"
         << "  --edge-pad  Add a transparent 5px border before flooding\n"
         << "\n"
         << "Composition:\n"
         << "  --fit <contain|cover>  Canvas fit (default: contain)\n"
         << "  --scale <0.5-1.5>  Content scale (default: 1.0)\n"
         << "  --safe-margin  Same as --scale 0.9\n"
         << "  --target-size <px>  Master canvas size (default: 1024)\n"
         << "  --shape-weight <-10..10>  Choke (negative) or expand (positive) the shape\n"
         << "\n"
         << "Stroke:\n"
         << "  --stroke-color <RRGGBB[AA]>  Enable stroke with this color (default: FFFFFF)\n"
         << "  --stroke-width <1-50>  Stroke width in px (default: 4)\n"
         << "  --stroke-align <outside|center|inside>  (default: outside)\n"
         << "\n"
         << "Edges:\n"
         << "  --liquid-polish <0-1>  Supersampled edge smoothing (default: 0)\n"
         << "  --debris-threshold <0-50>  Alpha below this is removed (default: 10)\n"
         << "  --smooth <0-10>  Edge blur radius (default: 0.3)\n"
         << "  --corner-sharpness <0-100>  50 is neutral (default: 50)\n"
         << "  --resolution-snap <0-100>  Extra sharpening (default: 0)\n"
         << "\n"
         << "Inspection:\n"
         << "  --audit  Print the quality audit and metrics of the input, write nothing\n"
         << "  --reference <image>  With --audit, compare metrics against a reference\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Save every stage image to ./debug/\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i logo.png\n"
         << "  " << progName << " -i logo.jpg --mask flood --tolerance 40 --sizes windows\n"
         << "  " << progName << " -i logo.png --mask key --key FFFFFF:20 --key F0F0F0\n"
         << "  " << progName << " -i logo.png --stroke-color 000000 --stroke-width 8\n"
         << "  " << progName << " -i logo.png --safe-margin --liquid-polish 0.5\n"
         << "  " << progName << " -i icon.png --audit --reference app_store_icon.png\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage) {
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(IconForgeResult error_code, const char* error_message) {
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

void printMetrics(const char* label, const IconForgeMetrics& metrics) {
    cout << "  " << label << ": sharpness " << metrics.sharpness
         << ", contrast " << metrics.contrast
         << ", brightness " << metrics.brightness
         << ", palette " << metrics.palette_size << endl;
}

int runAudit(const Arguments& args) {
    static const char* severityNames[] = {"PASS", "INFO", "WARN", "ERROR"};

    IconForgeAuditReport report;
    IconForgeResult result = icon_forge_audit_image(args.inputPath.c_str(), &report, errorCallback);
    if (result != ICON_FORGE_SUCCESS) {
        cerr << "[ERROR] Audit failed: " << icon_forge_get_error_message(result) << endl;
        return 1;
    }

    cout << "[INFO] Quality audit for " << args.inputPath << endl;
    for (int32_t i = 0; i < report.issue_count; i++) {
        const IconForgeAuditIssue& issue = report.issues[i];
        cout << "  [" << severityNames[issue.severity] << "] " << issue.check_name << ": " << issue.message;
        if (issue.fix_action[0] != '\0') {
            cout << " (fix: " << issue.fix_action << ")";
        }
        cout << endl;
    }
    icon_forge_free_audit_report(&report);

    if (args.referencePath.empty()) {
        IconForgeMetrics metrics;
        result = icon_forge_analyze_metrics(args.inputPath.c_str(), &metrics, errorCallback);
        if (result != ICON_FORGE_SUCCESS) {
            cerr << "[ERROR] Metrics failed: " << icon_forge_get_error_message(result) << endl;
            return 1;
        }
        printMetrics("Metrics", metrics);
        return 0;
    }

    IconForgeComparison comparison;
    result = icon_forge_compare_to_reference(args.inputPath.c_str(), args.referencePath.c_str(),
                                             &comparison, errorCallback);
    if (result != ICON_FORGE_SUCCESS) {
        cerr << "[ERROR] Comparison failed: " << icon_forge_get_error_message(result) << endl;
        return 1;
    }
    printMetrics("Yours", comparison.yours);
    printMetrics("Reference", comparison.reference);
    cout << "  Diff: sharpness " << showpos << comparison.sharpness_diff
         << ", contrast " << comparison.contrast_diff
         << ", brightness " << comparison.brightness_diff
         << ", palette " << comparison.palette_diff << noshowpos << endl;
    return 0;
}

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const exception& e) {
        cerr << "[ERROR] " << e.what() << endl;
        printUsage(argv[0]);
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] IconForge CLI v" << icon_forge_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.outputDir << "/" << args.iconName << "_*.png" << endl;
    }

    // Validate input file
    if (!icon_forge_is_valid_image_file(args.inputPath.c_str())) {
        cerr << "[ERROR] Input file is not a valid image or does not exist: " << args.inputPath << endl;
        return 1;
    }

    if (args.auditOnly) {
        return runAudit(args);
    }

    // Get default parameters
    IconForgeParams params;
    icon_forge_get_default_params(&params);

    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - stage images will be saved to ./debug/" << endl;
    }
    params.verbose_output = args.verbose;

    if (args.maskMode == "none") {
        params.mask_mode = ICON_FORGE_MASK_NONE;
    } else if (args.maskMode == "crop") {
        params.mask_mode = ICON_FORGE_MASK_AUTO_CROP;
        params.crop_padding = args.cropPadding;
    } else if (args.maskMode == "key") {
        params.mask_mode = ICON_FORGE_MASK_COLOR_KEY;
        if (args.keys.size() > ICON_FORGE_MAX_COLOR_KEYS) {
            cerr << "[ERROR] At most " << ICON_FORGE_MAX_COLOR_KEYS << " color keys are supported" << endl;
            return 1;
        }
        if (args.keys.empty()) {
            params.color_keys[0].tolerance = args.floodTolerance;
        } else {
            for (size_t k = 0; k < args.keys.size(); k++) {
                params.color_keys[k] = args.keys[k];
            }
            params.color_key_count = static_cast<int32_t>(args.keys.size());
        }
        cout << "[INFO] Color key masking with " << params.color_key_count << " key(s)" << endl;
    } else if (args.maskMode == "flood") {
        params.mask_mode = ICON_FORGE_MASK_BORDER_FLOOD;
        params.flood_seed_all_edges = args.seedAllEdges;
        params.edge_protect_pad = args.edgePad;
        cout << "[INFO] Border flood masking from " << (args.seedAllEdges ? "all edges" : "corners")
             << ", tolerance " << args.floodTolerance << endl;
    } else {
        cerr << "[ERROR] Unknown mask mode: " << args.maskMode << endl;
        return 1;
    }
    params.flood_tolerance = args.floodTolerance;
    params.auto_crop_after = args.autoCropAfter;

    params.fit_mode = args.cover ? ICON_FORGE_FIT_COVER : ICON_FORGE_FIT_CONTAIN;
    params.scale = args.scale;
    params.target_size = args.targetSize;
    params.shape_weight = args.shapeWeight;

    if (args.strokeEnabled) {
        params.stroke_enabled = true;
        params.stroke_color[0] = static_cast<uint8_t>(args.strokeColor >> 24);
        params.stroke_color[1] = static_cast<uint8_t>(args.strokeColor >> 16);
        params.stroke_color[2] = static_cast<uint8_t>(args.strokeColor >> 8);
        params.stroke_color[3] = static_cast<uint8_t>(args.strokeColor);
        params.stroke_width = args.strokeWidth;
        if (args.strokeAlign == "outside") {
            params.stroke_alignment = ICON_FORGE_STROKE_OUTSIDE;
        } else if (args.strokeAlign == "center") {
            params.stroke_alignment = ICON_FORGE_STROKE_CENTER;
        } else if (args.strokeAlign == "inside") {
            params.stroke_alignment = ICON_FORGE_STROKE_INSIDE;
        } else {
            cerr << "[ERROR] Unknown stroke alignment: " << args.strokeAlign << endl;
            return 1;
        }
        cout << "[INFO] Stroke enabled: " << args.strokeWidth << "px " << args.strokeAlign << endl;
    }

    params.liquid_polish_intensity = args.liquidPolish;
    params.debris_threshold = args.debrisThreshold;
    params.smooth_blur_radius = args.smoothBlur;
    params.corner_sharpness = args.cornerSharpness;
    params.resolution_snap = args.resolutionSnap;

    params.binary_alpha_variant = args.binaryAlpha;
    params.thread_limit = args.threads;

    // Validate parameters
    IconForgeResult validation_result = icon_forge_validate_params(&params);
    if (validation_result != ICON_FORGE_SUCCESS) {
        cerr << "[ERROR] Invalid parameters: " << icon_forge_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.sizes.size() > ICON_FORGE_MAX_SIZES) {
        cerr << "[ERROR] At most " << ICON_FORGE_MAX_SIZES << " sizes per run" << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Canvas: " << params.target_size << "px, "
             << (params.fit_mode == ICON_FORGE_FIT_COVER ? "cover" : "contain")
             << " at scale " << params.scale << endl;
        cout << "  Shape weight: " << params.shape_weight << endl;
        cout << "  Liquid polish: " << params.liquid_polish_intensity << endl;
        cout << "  Edges: debris " << params.debris_threshold << ", blur " << params.smooth_blur_radius
             << ", corners " << params.corner_sharpness << ", snap " << params.resolution_snap << endl;
        cout << "  Sizes: ";
        if (args.sizes.empty()) {
            cout << "all presets";
        }
        for (size_t s = 0; s < args.sizes.size(); s++) {
            cout << (s ? ", " : "") << args.sizes[s];
        }
        cout << endl;
    }

    IconForgeResult result = icon_forge_process_image_to_png_set(
        args.inputPath.c_str(),
        args.outputDir.c_str(),
        args.iconName.c_str(),
        args.sizes.empty() ? nullptr : args.sizes.data(),
        static_cast<int32_t>(args.sizes.size()),
        &params,
        args.verbose ? progressCallback : nullptr,
        errorCallback,
        nullptr
    );

    if (result == ICON_FORGE_SUCCESS) {
        cout << "[SUCCESS] Icon set written to: " << args.outputDir << endl;
        return 0;
    } else {
        const char* error_msg = icon_forge_get_error_message(result);
        cerr << "[ERROR] Processing failed: " << error_msg << endl;
        return 1;
    }
}
