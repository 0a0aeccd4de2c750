#ifndef ICON_FORGE_API_H
#define ICON_FORGE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define ICON_FORGE_VERSION_MAJOR 1
#define ICON_FORGE_VERSION_MINOR 0
#define ICON_FORGE_VERSION_PATCH 0

#define ICON_FORGE_MAX_COLOR_KEYS 8
#define ICON_FORGE_MAX_SIZES 32

typedef enum {
    ICON_FORGE_SUCCESS = 0,
    ICON_FORGE_ERROR_INVALID_INPUT = -1,
    ICON_FORGE_ERROR_FILE_NOT_FOUND = -2,
    ICON_FORGE_ERROR_IMAGE_LOAD_FAILED = -3,
    ICON_FORGE_ERROR_INVALID_PARAMETERS = -4,
    ICON_FORGE_ERROR_PROCESSING_FAILED = -5,
    ICON_FORGE_ERROR_WRITE_FAILED = -6,
    ICON_FORGE_ERROR_CANCELLED = -7
} IconForgeResult;

typedef enum {
    ICON_FORGE_MASK_NONE = 0,
    ICON_FORGE_MASK_AUTO_CROP = 1,
    ICON_FORGE_MASK_COLOR_KEY = 2,
    ICON_FORGE_MASK_BORDER_FLOOD = 3
} IconForgeMaskMode;

typedef enum {
    ICON_FORGE_FIT_CONTAIN = 0,
    ICON_FORGE_FIT_COVER = 1
} IconForgeFitMode;

typedef enum {
    ICON_FORGE_STROKE_OUTSIDE = 0,
    ICON_FORGE_STROKE_CENTER = 1,
    ICON_FORGE_STROKE_INSIDE = 2
} IconForgeStrokeAlignment;

typedef enum {
    ICON_FORGE_PRESET_WINDOWS = 0,  // 16, 32, 48, 256
    ICON_FORGE_PRESET_MAC = 1,      // 16 through 1024
    ICON_FORGE_PRESET_WEB = 2,      // 100
    ICON_FORGE_PRESET_ALL = 3
} IconForgeSizePreset;

typedef enum {
    ICON_FORGE_SEVERITY_PASS = 0,
    ICON_FORGE_SEVERITY_INFO = 1,
    ICON_FORGE_SEVERITY_WARNING = 2,
    ICON_FORGE_SEVERITY_ERROR = 3
} IconForgeSeverity;

typedef struct {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    int32_t tolerance;              // 0-255 per-channel distance
} IconForgeColorKey;

// Processing parameters structure
typedef struct {
    // Masking
    int32_t mask_mode;              // IconForgeMaskMode (default: NONE)
    int32_t crop_padding;           // Padding for AUTO_CROP mode (default: 5)
    IconForgeColorKey color_keys[ICON_FORGE_MAX_COLOR_KEYS];
    int32_t color_key_count;        // Keys used by COLOR_KEY mode (default: 1, white)
    bool auto_crop_after;           // Crop to content after COLOR_KEY / BORDER_FLOOD (default: true)
    int32_t flood_tolerance;        // BORDER_FLOOD neighbor tolerance (default: 30)
    bool flood_seed_all_edges;      // Seed from every border pixel instead of corners (default: false)
    bool edge_protect_pad;          // Transparent 5px pad before flooding (default: false)

    // Composition
    int32_t fit_mode;               // IconForgeFitMode (default: CONTAIN)
    double scale;                   // 0.5-1.5 (default: 1.0, safe margin: 0.9)
    int32_t target_size;            // Master canvas size (default: 1024)

    // Shape weight
    int32_t shape_weight;           // -10..10 (default: 0)

    // Stroke
    bool stroke_enabled;            // (default: false)
    uint8_t stroke_color[4];        // RGBA (default: opaque white)
    int32_t stroke_width;           // 1-50 (default: 4)
    int32_t stroke_alignment;       // IconForgeStrokeAlignment (default: OUTSIDE)

    // Smoothing
    double liquid_polish_intensity; // 0-1, 0 disables (default: 0.0)
    int32_t debris_threshold;       // 0-50 alpha units (default: 10)
    double smooth_blur_radius;      // 0-10 (default: 0.3)
    int32_t corner_sharpness;       // 0-100, 50 neutral (default: 50)
    int32_t resolution_snap;        // 0-100 (default: 0)

    // Export
    bool binary_alpha_variant;      // Also write hard-alpha PNGs (default: false)
    int32_t thread_limit;           // Export workers, 0 = auto (default: 0)

    // Debug visualization
    bool enable_debug_output;       // Save stage images to ./debug/ (default: false)
    bool verbose_output;            // Console logging (default: false)
} IconForgeParams;

typedef struct {
    double sharpness;
    double contrast;
    double brightness;
    int32_t palette_size;
} IconForgeMetrics;

typedef struct {
    IconForgeMetrics yours;
    IconForgeMetrics reference;
    double sharpness_diff;
    double contrast_diff;
    double brightness_diff;
    int32_t palette_diff;
} IconForgeComparison;

typedef struct {
    char check_name[32];
    int32_t severity;               // IconForgeSeverity
    char message[256];
    char fix_action[32];            // Empty when no fix is available
} IconForgeAuditIssue;

typedef struct {
    IconForgeAuditIssue* issues;
    int32_t issue_count;
} IconForgeAuditReport;

// Opaque cancellation handle shared between the caller and a running export
typedef struct IconForgeCancelToken IconForgeCancelToken;

// Progress callback function type for UI progress tracking
typedef void (*IconForgeProgressCallback)(double progress, const char* stage);

// Error callback function type for detailed error reporting
typedef void (*IconForgeErrorCallback)(IconForgeResult error_code, const char* error_message);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void icon_forge_get_default_params(IconForgeParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return ICON_FORGE_SUCCESS if valid, error code otherwise
 */
IconForgeResult icon_forge_validate_params(const IconForgeParams* params);

/**
 * Process an image and write one PNG per size: <output_dir>/<icon_name>_<N>x<N>.png
 * @param input_path Path to input image file
 * @param output_dir Directory for the PNG set (created, with parents, when missing)
 * @param icon_name File name stem for the outputs
 * @param sizes Target sizes (NULL or size_count 0 for every preset size)
 * @param size_count Number of entries in sizes
 * @param params Processing parameters (defaults if NULL)
 * @param progress_callback Optional progress callback for UI updates
 * @param error_callback Optional error callback for detailed error reporting
 * @param cancel_token Optional token; once cancelled no further size is rendered,
 *        nothing is written and ICON_FORGE_ERROR_CANCELLED is returned
 * @return ICON_FORGE_SUCCESS if successful, error code otherwise
 */
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
);

/**
 * Create a cancellation token (free with icon_forge_destroy_cancel_token)
 * @return New token, or NULL on allocation failure
 */
IconForgeCancelToken* icon_forge_create_cancel_token(void);

/**
 * Request cancellation. Safe to call from any thread while an export runs.
 */
void icon_forge_cancel(IconForgeCancelToken* token);

/**
 * Free a token created by icon_forge_create_cancel_token. NULL is ignored.
 */
void icon_forge_destroy_cancel_token(IconForgeCancelToken* token);

/**
 * Run the quality audit on an image file
 * @param image_path Path to image file
 * @param report Report to fill (caller must free with icon_forge_free_audit_report)
 * @param error_callback Optional error callback
 * @return ICON_FORGE_SUCCESS if successful, error code otherwise
 */
IconForgeResult icon_forge_audit_image(
    const char* image_path,
    IconForgeAuditReport* report,
    IconForgeErrorCallback error_callback
);

/**
 * Compute quality metrics for an image file
 */
IconForgeResult icon_forge_analyze_metrics(
    const char* image_path,
    IconForgeMetrics* metrics,
    IconForgeErrorCallback error_callback
);

/**
 * Compare an image against a reference (reference is resampled to the image size)
 */
IconForgeResult icon_forge_compare_to_reference(
    const char* image_path,
    const char* reference_path,
    IconForgeComparison* comparison,
    IconForgeErrorCallback error_callback
);

/**
 * Copy a preset's sizes (ascending) into sizes
 * @param preset IconForgeSizePreset
 * @param sizes Destination buffer
 * @param capacity Entries available in sizes
 * @return Number of sizes in the preset, or -1 for an unknown preset. Nothing is
 *         written past capacity.
 */
int32_t icon_forge_get_preset_sizes(int32_t preset, int32_t* sizes, int32_t capacity);

// Memory management functions

/**
 * Free report memory allocated by icon_forge_audit_image
 * @param report Pointer to report to free
 */
void icon_forge_free_audit_report(IconForgeAuditReport* report);

// Utility functions

/**
 * Get human-readable error message for error code
 * @param error_code Error code from IconForgeResult
 * @return Static string describing the error (do not free)
 */
const char* icon_forge_get_error_message(IconForgeResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* icon_forge_get_version(void);

/**
 * Check if input file appears to be a valid image
 * @param file_path Path to image file
 * @return true if file appears to be a valid image, false otherwise
 */
bool icon_forge_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // ICON_FORGE_API_H
