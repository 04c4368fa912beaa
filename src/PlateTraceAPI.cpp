#include "PlateTraceAPI.h"
#include "PlateProcessor.hpp"
#include "DXFWriter.hpp"
#include "Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace PlateTrace;

// Internal helper functions
namespace {

    // Carries a result code out of the C++ pipeline
    struct ApiFailure {
        PlateTraceResult code;
        std::string message;
    };

    PlateProcessor::ProcessingParams convertParams(const PlateTraceParams* params) {
        PlateProcessor::ProcessingParams cpp_params;
        if (params) {
            cpp_params.bilateralDiameter = params->bilateral_diameter;
            cpp_params.bilateralSigmaColor = params->bilateral_sigma_color;
            cpp_params.bilateralSigmaSpace = params->bilateral_sigma_space;

            cpp_params.cannyLower = params->canny_lower;
            cpp_params.cannyUpper = params->canny_upper;
            cpp_params.cannyAperture = params->canny_aperture;

            cpp_params.topK = params->top_k;
            cpp_params.polygonEpsilon = params->polygon_epsilon;
            cpp_params.requireConvex = params->require_convex;

            cpp_params.enableDebugOutput = params->enable_debug_output;
            cpp_params.verboseOutput = params->verbose_output;
        }
        return cpp_params;
    }

    void convertLocation(const Polygon& polygon, const BoundingBox& box, const cv::Size& imageSize,
                         PlateTraceLocation* location) {
        for (size_t i = 0; i < 4; i++) {
            location->corners[i].row = polygon[i].y;
            location->corners[i].col = polygon[i].x;
        }
        location->box.row_min = box.rowMin;
        location->box.col_min = box.colMin;
        location->box.row_max = box.rowMax;
        location->box.col_max = box.colMax;
        location->image_rows = imageSize.height;
        location->image_cols = imageSize.width;
    }

    void clearLocation(PlateTraceLocation* location) {
        if (!location) return;
        *location = PlateTraceLocation{};
    }

    PlateTraceResult fail(PlateTraceResult code, const std::string& message,
                          PlateTraceErrorCallback error_callback, void* user_data) {
        if (error_callback) {
            error_callback(code, message.c_str(), user_data);
        }
        return code;
    }

    // Convert a C++ exception to an error code
    PlateTraceResult handleCurrentException(PlateTraceErrorCallback error_callback, void* user_data) {
        try {
            throw;
        } catch (const ApiFailure& f) {
            return fail(f.code, f.message, error_callback, user_data);
        } catch (const ImageLoadError& e) {
            return fail(PLATE_TRACE_ERROR_IMAGE_LOAD_FAILED, e.what(), error_callback, user_data);
        } catch (const NoCandidateFoundError& e) {
            return fail(PLATE_TRACE_ERROR_NO_CANDIDATE, e.what(), error_callback, user_data);
        } catch (const EmptyMaskError& e) {
            return fail(PLATE_TRACE_ERROR_EMPTY_MASK, e.what(), error_callback, user_data);
        } catch (const OutOfBoundsError& e) {
            return fail(PLATE_TRACE_ERROR_OUT_OF_BOUNDS, e.what(), error_callback, user_data);
        } catch (const EmptyInputError& e) {
            return fail(PLATE_TRACE_ERROR_EMPTY_INPUT, e.what(), error_callback, user_data);
        } catch (const std::invalid_argument& e) {
            return fail(PLATE_TRACE_ERROR_INVALID_INPUT, e.what(), error_callback, user_data);
        } catch (const std::exception& e) {
            return fail(PLATE_TRACE_ERROR_PROCESSING_FAILED, e.what(), error_callback, user_data);
        } catch (...) {
            // Nothing may cross the C boundary
            return fail(PLATE_TRACE_ERROR_PROCESSING_FAILED, "Unknown exception", error_callback, user_data);
        }
    }

    // Progress reporting helper
    void reportProgress(PlateTraceProgressCallback callback, double progress, const char* stage, void* user_data) {
        if (callback) {
            callback(progress, stage, user_data);
        }
    }

    PlateTraceResult checkInputFile(const char* input_path, PlateTraceErrorCallback error_callback, void* user_data) {
        std::ifstream file(input_path);
        if (!file.good()) {
            return fail(PLATE_TRACE_ERROR_FILE_NOT_FOUND, std::string("Input file not found or not readable: ") + input_path,
                        error_callback, user_data);
        }
        return PLATE_TRACE_SUCCESS;
    }

    PlateProcessor::PlateResult runPipeline(const char* input_path, const PlateProcessor::ProcessingParams& cpp_params,
                                            PlateTraceProgressCallback progress_callback, void* user_data) {
        reportProgress(progress_callback, 0.1, "Locating plate", user_data);
        PlateProcessor::PlateResult result = PlateProcessor::processImage(input_path, cpp_params);
        reportProgress(progress_callback, 0.8, "Plate region extracted", user_data);
        return result;
    }

    void writeImage(const char* path, const cv::Mat& image) {
        if (!path) return;
        bool ok = false;
        try {
            ok = cv::imwrite(path, image);
        } catch (const cv::Exception& e) {
            throw ApiFailure{PLATE_TRACE_ERROR_IMAGE_WRITE_FAILED, e.what()};
        }
        if (!ok) {
            throw ApiFailure{PLATE_TRACE_ERROR_IMAGE_WRITE_FAILED, std::string("Failed to write image: ") + path};
        }
    }
}

// API Implementation

void plate_trace_get_default_params(PlateTraceParams* params) {
    if (!params) return;

    params->bilateral_diameter = 17;
    params->bilateral_sigma_color = 17.0;
    params->bilateral_sigma_space = 11.0;

    params->canny_lower = 30.0;
    params->canny_upper = 200.0;
    params->canny_aperture = 3;

    params->top_k = 10;
    params->polygon_epsilon = 10.0;
    params->require_convex = false;

    params->enable_debug_output = false;
    params->verbose_output = false;
}

PlateTraceResult plate_trace_validate_params(const PlateTraceParams* params) {
    if (!params) return PLATE_TRACE_ERROR_INVALID_PARAMETERS;

    // Noise reduction
    if (params->bilateral_diameter < 1 || params->bilateral_diameter > 50) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->bilateral_sigma_color > 0.0 && params->bilateral_sigma_color <= 300.0) ||
        !(params->bilateral_sigma_space > 0.0 && params->bilateral_sigma_space <= 300.0)) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    // Canny edge detection parameters
    if (!(params->canny_lower >= 0.0 && params->canny_lower <= 1000.0) ||
        !(params->canny_upper >= 0.0 && params->canny_upper <= 1000.0) ||
        params->canny_lower >= params->canny_upper) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (params->canny_aperture < 3 || params->canny_aperture > 7 || params->canny_aperture % 2 == 0) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    // Candidate selection
    if (params->top_k < 1 || params->top_k > 1000) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    if (!(params->polygon_epsilon >= 0.0 && params->polygon_epsilon <= 1000.0)) {
        return PLATE_TRACE_ERROR_INVALID_PARAMETERS;
    }

    return PLATE_TRACE_SUCCESS;
}

PlateTraceResult plate_trace_locate_plate(
    const char* input_path,
    const PlateTraceParams* params,
    PlateTraceLocation* location,
    PlateTraceProgressCallback progress_callback,
    PlateTraceErrorCallback error_callback,
    void* user_data
) {
    if (!input_path || !location) {
        return fail(PLATE_TRACE_ERROR_INVALID_INPUT, "Invalid input parameters", error_callback, user_data);
    }
    clearLocation(location);

    PlateTraceResult file_result = checkInputFile(input_path, error_callback, user_data);
    if (file_result != PLATE_TRACE_SUCCESS) {
        return file_result;
    }

    PlateTraceParams default_params;
    if (!params) {
        plate_trace_get_default_params(&default_params);
        params = &default_params;
    }

    PlateTraceResult validation_result = plate_trace_validate_params(params);
    if (validation_result != PLATE_TRACE_SUCCESS) {
        return fail(validation_result, "Invalid processing parameters", error_callback, user_data);
    }

    try {
        PlateProcessor::ProcessingParams cpp_params = convertParams(params);
        PlateProcessor::PlateResult result = runPipeline(input_path, cpp_params, progress_callback, user_data);

        convertLocation(result.location, result.extraction.box, result.original.size(), location);
        reportProgress(progress_callback, 1.0, "Plate located", user_data);
        return PLATE_TRACE_SUCCESS;
    } catch (...) {
        return handleCurrentException(error_callback, user_data);
    }
}

PlateTraceResult plate_trace_process_image_to_files(
    const char* input_path,
    const PlateTraceOutputs* outputs,
    const PlateTraceParams* params,
    PlateTraceLocation* location,
    PlateTraceProgressCallback progress_callback,
    PlateTraceErrorCallback error_callback,
    void* user_data
) {
    if (!input_path || !outputs) {
        return fail(PLATE_TRACE_ERROR_INVALID_INPUT, "Invalid input or output paths", error_callback, user_data);
    }
    if (!outputs->crop_path && !outputs->mask_path && !outputs->masked_path && !outputs->annotated_path) {
        return fail(PLATE_TRACE_ERROR_INVALID_INPUT, "No output path given", error_callback, user_data);
    }
    clearLocation(location);

    PlateTraceResult file_result = checkInputFile(input_path, error_callback, user_data);
    if (file_result != PLATE_TRACE_SUCCESS) {
        return file_result;
    }

    PlateTraceParams default_params;
    if (!params) {
        plate_trace_get_default_params(&default_params);
        params = &default_params;
    }

    PlateTraceResult validation_result = plate_trace_validate_params(params);
    if (validation_result != PLATE_TRACE_SUCCESS) {
        return fail(validation_result, "Invalid processing parameters", error_callback, user_data);
    }

    try {
        PlateProcessor::ProcessingParams cpp_params = convertParams(params);
        PlateProcessor::PlateResult result = runPipeline(input_path, cpp_params, progress_callback, user_data);

        reportProgress(progress_callback, 0.9, "Writing output images", user_data);
        writeImage(outputs->crop_path, result.extraction.croppedGray);
        writeImage(outputs->mask_path, result.extraction.mask);
        writeImage(outputs->masked_path, result.extraction.maskedImage);
        if (outputs->annotated_path) {
            writeImage(outputs->annotated_path, PlateProcessor::annotate(result.original, result.location, "", cpp_params));
        }

        if (location) {
            convertLocation(result.location, result.extraction.box, result.original.size(), location);
        }
        reportProgress(progress_callback, 1.0, "Plate extraction complete", user_data);
        return PLATE_TRACE_SUCCESS;
    } catch (...) {
        return handleCurrentException(error_callback, user_data);
    }
}

PlateTraceResult plate_trace_save_location_to_dxf(
    const PlateTraceLocation* location,
    const char* output_path,
    double pixels_per_unit,
    PlateTraceErrorCallback error_callback,
    void* user_data
) {
    if (!location || !output_path || !(pixels_per_unit > 0.0)) {
        return fail(PLATE_TRACE_ERROR_INVALID_INPUT, "Invalid location, output path or scale", error_callback, user_data);
    }

    std::vector<cv::Point> corners;
    corners.reserve(4);
    for (const auto& corner : location->corners) {
        corners.emplace_back(corner.col, corner.row);
    }

    if (!DXFWriter::savePolygonAsDXF(Polygon(corners), pixels_per_unit, output_path)) {
        return fail(PLATE_TRACE_ERROR_DXF_WRITE_FAILED, "Failed to write DXF file", error_callback, user_data);
    }
    return PLATE_TRACE_SUCCESS;
}

const char* plate_trace_get_error_message(PlateTraceResult error_code) {
    switch (error_code) {
        case PLATE_TRACE_SUCCESS: return "Success";
        case PLATE_TRACE_ERROR_INVALID_INPUT: return "Invalid input parameters";
        case PLATE_TRACE_ERROR_FILE_NOT_FOUND: return "Input file not found or not readable";
        case PLATE_TRACE_ERROR_IMAGE_LOAD_FAILED: return "Failed to load image - check format and file integrity";
        case PLATE_TRACE_ERROR_EMPTY_INPUT: return "Image has zero area";
        case PLATE_TRACE_ERROR_NO_CANDIDATE: return "Localization failed - no quadrilateral plate candidate found";
        case PLATE_TRACE_ERROR_EMPTY_MASK: return "Plate mask is empty";
        case PLATE_TRACE_ERROR_OUT_OF_BOUNDS: return "Crop box exceeds image extent";
        case PLATE_TRACE_ERROR_DXF_WRITE_FAILED: return "Failed to write DXF file - check output path permissions";
        case PLATE_TRACE_ERROR_INVALID_PARAMETERS: return "Invalid processing parameters - check parameter ranges";
        case PLATE_TRACE_ERROR_IMAGE_WRITE_FAILED: return "Failed to write output image - check path and extension";
        case PLATE_TRACE_ERROR_PROCESSING_FAILED: return "Image processing failed - see error callback for details";
        default: return "Unknown error";
    }
}

const char* plate_trace_get_version(void) {
    return "1.0.0";
}

bool plate_trace_is_valid_image_file(const char* file_path) {
    if (!file_path) return false;

    try {
        cv::Mat img = cv::imread(file_path);
        return !img.empty();
    } catch (const cv::Exception& e) {
        std::cerr << "[WARN] " << e.what() << std::endl;
        return false;
    }
}
