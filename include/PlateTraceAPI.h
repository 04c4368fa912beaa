#ifndef PLATE_TRACE_API_H
#define PLATE_TRACE_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>

// Version information
#define PLATE_TRACE_VERSION_MAJOR 1
#define PLATE_TRACE_VERSION_MINOR 0
#define PLATE_TRACE_VERSION_PATCH 0

typedef enum {
    PLATE_TRACE_SUCCESS = 0,
    PLATE_TRACE_ERROR_INVALID_INPUT = -1,
    PLATE_TRACE_ERROR_FILE_NOT_FOUND = -2,
    PLATE_TRACE_ERROR_IMAGE_LOAD_FAILED = -3,
    PLATE_TRACE_ERROR_EMPTY_INPUT = -4,
    PLATE_TRACE_ERROR_NO_CANDIDATE = -5,
    PLATE_TRACE_ERROR_EMPTY_MASK = -6,
    PLATE_TRACE_ERROR_OUT_OF_BOUNDS = -7,
    PLATE_TRACE_ERROR_DXF_WRITE_FAILED = -8,
    PLATE_TRACE_ERROR_INVALID_PARAMETERS = -9,
    PLATE_TRACE_ERROR_IMAGE_WRITE_FAILED = -10,
    PLATE_TRACE_ERROR_PROCESSING_FAILED = -11
} PlateTraceResult;

// Processing parameters structure
typedef struct {
    // Noise reduction
    int32_t bilateral_diameter;     // Bilateral filter diameter (default: 17)
    double bilateral_sigma_color;   // Bilateral color sigma (default: 17.0)
    double bilateral_sigma_space;   // Bilateral space sigma (default: 11.0)

    // Edge detection parameters
    double canny_lower;             // Canny lower threshold (default: 30.0)
    double canny_upper;             // Canny upper threshold (default: 200.0)
    int32_t canny_aperture;         // Canny aperture size (default: 3)

    // Candidate selection
    int32_t top_k;                  // Largest contours considered (default: 10)
    double polygon_epsilon;         // Approximation tolerance in pixels (default: 10.0)
    bool require_convex;            // Only accept convex 4-gons (default: false)

    // Debug visualization
    bool enable_debug_output;       // Save step-by-step images to ./debug/ (default: false)
    bool verbose_output;            // Pipeline [INFO]/[WARN] lines on the console (default: false)
} PlateTraceParams;

// Raster position, row grows downward
typedef struct {
    int32_t row;
    int32_t col;
} PlateTracePoint;

// Inclusive on both ends
typedef struct {
    int32_t row_min;
    int32_t col_min;
    int32_t row_max;
    int32_t col_max;
} PlateTraceBox;

// Located plate
typedef struct {
    PlateTracePoint corners[4];     // Traversal order of the traced boundary
    PlateTraceBox box;              // Tight box of the filled plate mask
    int32_t image_rows;
    int32_t image_cols;
} PlateTraceLocation;

// Output files; NULL entries are skipped
typedef struct {
    const char* crop_path;          // Grayscale plate crop for OCR
    const char* mask_path;          // Binary plate mask
    const char* masked_path;        // Color image with everything outside the plate zeroed
    const char* annotated_path;     // Color image with the plate rectangle drawn
} PlateTraceOutputs;

typedef void (*PlateTraceProgressCallback)(double progress, const char* stage, void* user_data);

typedef void (*PlateTraceErrorCallback)(PlateTraceResult error_code, const char* error_message, void* user_data);

// Core API Functions

/**
 * Get default processing parameters
 * @param params Pointer to parameters structure to fill
 */
void plate_trace_get_default_params(PlateTraceParams* params);

/**
 * Validate processing parameters
 * @param params Pointer to parameters to validate
 * @return PLATE_TRACE_SUCCESS if valid, error code otherwise
 */
PlateTraceResult plate_trace_validate_params(const PlateTraceParams* params);

/**
 * Locate the plate quadrilateral in an image file
 * @param input_path Path to input image file
 * @param params Processing parameters (defaults if NULL)
 * @param location Filled on success
 * @param progress_callback Optional progress callback
 * @param error_callback Optional error callback for detailed error reporting
 * @param user_data Passed through to the callbacks
 * @return PLATE_TRACE_SUCCESS, PLATE_TRACE_ERROR_NO_CANDIDATE when no 4-gon was found, other codes on failure
 */
PlateTraceResult plate_trace_locate_plate(
    const char* input_path,
    const PlateTraceParams* params,
    PlateTraceLocation* location,
    PlateTraceProgressCallback progress_callback,
    PlateTraceErrorCallback error_callback,
    void* user_data
);

/**
 * Locate the plate and write the requested output images
 * @param input_path Path to input image file
 * @param outputs Output paths, at least one non-NULL
 * @param params Processing parameters (defaults if NULL)
 * @param location Optional, filled on success
 * @return PLATE_TRACE_SUCCESS if successful, error code otherwise
 */
PlateTraceResult plate_trace_process_image_to_files(
    const char* input_path,
    const PlateTraceOutputs* outputs,
    const PlateTraceParams* params,
    PlateTraceLocation* location,
    PlateTraceProgressCallback progress_callback,
    PlateTraceErrorCallback error_callback,
    void* user_data
);

/**
 * Save the plate outline to a DXF file
 * @param location Located plate
 * @param output_path Path for output DXF file
 * @param pixels_per_unit Raster pixels per drawing unit (> 0)
 * @return PLATE_TRACE_SUCCESS if successful, error code otherwise
 */
PlateTraceResult plate_trace_save_location_to_dxf(
    const PlateTraceLocation* location,
    const char* output_path,
    double pixels_per_unit,
    PlateTraceErrorCallback error_callback,
    void* user_data
);

// Utility functions

/**
 * Get human-readable error message for error code
 * @return Static string describing the error (do not free)
 */
const char* plate_trace_get_error_message(PlateTraceResult error_code);

/**
 * Get library version string
 * @return Static version string in format "major.minor.patch" (do not free)
 */
const char* plate_trace_get_version(void);

/**
 * Check if input file appears to be a valid image
 */
bool plate_trace_is_valid_image_file(const char* file_path);

#ifdef __cplusplus
}
#endif

#endif // PLATE_TRACE_API_H
