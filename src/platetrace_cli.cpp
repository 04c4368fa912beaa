#include <PlateTraceAPI.h>
#include <iostream>
#include <string>
#include <fstream>
#include <stdexcept>

using namespace std;

struct Arguments {
    string inputPath;
    string cropPath;
    string maskPath;
    string maskedPath;
    string annotatedPath;
    string dxfPath;
    bool valid = false;
    bool verbose = false;
    bool debug = false;

    // Candidate selection
    double epsilon = 10.0;
    int topK = 10;
    bool requireConvex = false;

    // Edge detection
    double cannyLower = 30.0;
    double cannyUpper = 200.0;

    // Noise reduction
    int bilateralDiameter = 17;
    double bilateralSigmaColor = 17.0;
    double bilateralSigmaSpace = 11.0;
};

Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;

    if (argc < 2) {
        return args;
    }

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if ((arg == "-i" || arg == "--input") && (i + 1 < argc)) {
            args.inputPath = argv[++i];
        } else if ((arg == "-o" || arg == "--output") && (i + 1 < argc)) {
            args.cropPath = argv[++i];
        } else if ((arg == "--mask") && (i + 1 < argc)) {
            args.maskPath = argv[++i];
        } else if ((arg == "--masked") && (i + 1 < argc)) {
            args.maskedPath = argv[++i];
        } else if ((arg == "--annotated") && (i + 1 < argc)) {
            args.annotatedPath = argv[++i];
        } else if ((arg == "--dxf") && (i + 1 < argc)) {
            args.dxfPath = argv[++i];
        } else if ((arg == "-e" || arg == "--epsilon") && (i + 1 < argc)) {
            args.epsilon = stod(argv[++i]);
        } else if ((arg == "-k" || arg == "--top-k") && (i + 1 < argc)) {
            args.topK = stoi(argv[++i]);
        } else if (arg == "--convex") {
            args.requireConvex = true;
        } else if ((arg == "--canny-lower") && (i + 1 < argc)) {
            args.cannyLower = stod(argv[++i]);
        } else if ((arg == "--canny-upper") && (i + 1 < argc)) {
            args.cannyUpper = stod(argv[++i]);
        } else if ((arg == "--bilateral-d") && (i + 1 < argc)) {
            args.bilateralDiameter = stoi(argv[++i]);
        } else if ((arg == "--bilateral-sigma-color") && (i + 1 < argc)) {
            args.bilateralSigmaColor = stod(argv[++i]);
        } else if ((arg == "--bilateral-sigma-space") && (i + 1 < argc)) {
            args.bilateralSigmaSpace = stod(argv[++i]);
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-d" || arg == "--debug") {
            args.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            return args; // Will trigger usage display
        }
    }

    if (args.inputPath.empty()) {
        return args;
    }

    // Auto-generate crop path if not provided
    if (args.cropPath.empty()) {
        size_t dotPos = args.inputPath.find_last_of('.');
        if (dotPos == string::npos) {
            args.cropPath = args.inputPath + "_plate.png";
        } else {
            args.cropPath = args.inputPath.substr(0, dotPos) + "_plate.png";
        }
    }

    args.valid = true;
    return args;
}

void printUsage(const char* progName) {
    cout << "PlateTrace CLI - Locate a license plate and crop it for OCR\n"
         << "Using libplatetrace v" << plate_trace_get_version() << "\n"
         << "\n"
         << "Usage: " << progName << " -i <input_image> [-o <crop_image>] [options]\n"
         << "\n"
         << "Required:\n"
         << "  -i, --input   Input image file path\n"
         << "\n"
         << "Outputs:\n"
         << "  -o, --output <path>   Grayscale plate crop (default: <input>_plate.png)\n"
         << "  --mask <path>         Binary plate mask\n"
         << "  --masked <path>       Color image with everything outside the plate zeroed\n"
         << "  --annotated <path>    Color image with the plate rectangle drawn\n"
         << "  --dxf <path>          Plate outline as DXF (pixel units)\n"
         << "\n"
         << "Candidate Selection:\n"
         << "  -e, --epsilon <px>    Polygon approximation tolerance (default: 10)\n"
         << "  -k, --top-k <n>       Number of largest contours examined (default: 10)\n"
         << "  --convex              Only accept convex quadrilaterals\n"
         << "\n"
         << "Edge Detection:\n"
         << "  --canny-lower <t>     Canny lower threshold (default: 30)\n"
         << "  --canny-upper <t>     Canny upper threshold (default: 200)\n"
         << "  --bilateral-d <n>     Bilateral filter diameter (default: 17)\n"
         << "  --bilateral-sigma-color <s>  (default: 17)\n"
         << "  --bilateral-sigma-space <s>  (default: 11)\n"
         << "\n"
         << "General:\n"
         << "  -v, --verbose Enable verbose output\n"
         << "  -d, --debug   Enable debug visualization (saves step-by-step images)\n"
         << "  -h, --help    Show this help message\n"
         << "\n"
         << "Examples:\n"
         << "  " << progName << " -i car.jpg\n"
         << "  " << progName << " -i car.jpg -o plate.png --annotated boxed.jpg\n"
         << "  " << progName << " -i car.jpg -e 6 -k 20  # Finer approximation, more candidates\n"
         << "  " << progName << " -i car.jpg --convex     # Reject non-convex 4-gons\n"
         << "  " << progName << " -i car.jpg -d  # Saves debug images to ./debug/\n"
         << endl;
}

// Progress callback for verbose mode
void progressCallback(double progress, const char* stage, void* user_data) {
    (void)user_data;
    cout << "[PROGRESS] " << stage << ": " << (int)(progress * 100) << "%" << endl;
}

// Error callback for detailed error reporting
void errorCallback(PlateTraceResult error_code, const char* error_message, void* user_data) {
    (void)user_data;
    cerr << "[ERROR] Code " << error_code << ": " << error_message << endl;
}

int main(int argc, char* argv[]) {
    Arguments args;
    try {
        args = parseArguments(argc, argv);
    } catch (const invalid_argument&) {
        cerr << "[ERROR] Invalid numeric option value" << endl;
        return 1;
    } catch (const out_of_range&) {
        cerr << "[ERROR] Numeric option value out of range" << endl;
        return 1;
    }

    if (!args.valid) {
        printUsage(argv[0]);
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] PlateTrace CLI v" << plate_trace_get_version() << endl;
        cout << "[INFO] Processing: " << args.inputPath << " -> " << args.cropPath << endl;
    }

    // Validate input file
    if (!std::ifstream(args.inputPath).good()) {
        cerr << "[ERROR] Input file is not readable: " << args.inputPath << endl;
        return 1;
    }

    if (!plate_trace_is_valid_image_file(args.inputPath.c_str())) {
        cerr << "[ERROR] Input file is not a valid image: " << args.inputPath << endl;
        return 1;
    }

    PlateTraceParams params;
    plate_trace_get_default_params(&params);

    params.polygon_epsilon = args.epsilon;
    params.top_k = args.topK;
    params.require_convex = args.requireConvex;
    params.canny_lower = args.cannyLower;
    params.canny_upper = args.cannyUpper;
    params.bilateral_diameter = args.bilateralDiameter;
    params.bilateral_sigma_color = args.bilateralSigmaColor;
    params.bilateral_sigma_space = args.bilateralSigmaSpace;

    params.verbose_output = args.verbose;

    if (args.debug) {
        params.enable_debug_output = true;
        cout << "[INFO] Debug mode enabled - images will be saved to ./debug/" << endl;
    }

    PlateTraceResult validation_result = plate_trace_validate_params(&params);
    if (validation_result != PLATE_TRACE_SUCCESS) {
        cerr << "[ERROR] " << plate_trace_get_error_message(validation_result) << endl;
        return 1;
    }

    if (args.verbose) {
        cout << "[INFO] Using parameters:" << endl;
        cout << "  Bilateral filter: d=" << params.bilateral_diameter << " sigmaColor=" << params.bilateral_sigma_color
             << " sigmaSpace=" << params.bilateral_sigma_space << endl;
        cout << "  Canny edges: " << params.canny_lower << "-" << params.canny_upper << endl;
        cout << "  Top-K candidates: " << params.top_k << endl;
        cout << "  Polygon epsilon: " << params.polygon_epsilon << endl;
        cout << "  Criterion: " << (params.require_convex ? "convex quadrilateral" : "quadrilateral") << endl;
    }

    PlateTraceOutputs outputs;
    outputs.crop_path = args.cropPath.c_str();
    outputs.mask_path = args.maskPath.empty() ? nullptr : args.maskPath.c_str();
    outputs.masked_path = args.maskedPath.empty() ? nullptr : args.maskedPath.c_str();
    outputs.annotated_path = args.annotatedPath.empty() ? nullptr : args.annotatedPath.c_str();

    PlateTraceLocation location;
    PlateTraceResult result = plate_trace_process_image_to_files(
        args.inputPath.c_str(),
        &outputs,
        &params,
        &location,
        args.verbose ? progressCallback : nullptr,
        args.verbose ? errorCallback : nullptr,
        nullptr  // No user data needed for CLI
    );

    if (result == PLATE_TRACE_ERROR_NO_CANDIDATE) {
        cerr << "[WARN] " << plate_trace_get_error_message(result) << endl;
        cerr << "[WARN] Try a different --epsilon, --top-k or Canny thresholds" << endl;
        return 2;
    }
    if (result != PLATE_TRACE_SUCCESS) {
        cerr << "[ERROR] Processing failed: " << plate_trace_get_error_message(result) << endl;
        return 1;
    }

    cout << "[SUCCESS] Plate located at";
    for (const auto& corner : location.corners) {
        cout << " (" << corner.row << "," << corner.col << ")";
    }
    cout << endl;
    cout << "[INFO] Bounding box: rows " << location.box.row_min << "-" << location.box.row_max
         << ", cols " << location.box.col_min << "-" << location.box.col_max << endl;
    cout << "[INFO] Crop saved to: " << args.cropPath << endl;

    if (!args.dxfPath.empty()) {
        PlateTraceResult dxf_result = plate_trace_save_location_to_dxf(
            &location, args.dxfPath.c_str(), 1.0,
            args.verbose ? errorCallback : nullptr, nullptr);
        if (dxf_result != PLATE_TRACE_SUCCESS) {
            cerr << "[ERROR] " << plate_trace_get_error_message(dxf_result) << endl;
            return 1;
        }
        cout << "[INFO] Outline saved to: " << args.dxfPath << endl;
    }

    return 0;
}
