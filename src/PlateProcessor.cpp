#include "PlateProcessor.hpp"
#include "BoundaryTracer.hpp"
#include "CandidateRanker.hpp"
#include "Errors.hpp"
#include "MaskRasterizer.hpp"
#include "PlateSelector.hpp"
#include "RegionExtractor.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

using namespace cv;
using namespace std;

namespace PlateTrace {

Mat PlateProcessor::loadImage(const string& path) {
    if (path.empty()) {
        throw invalid_argument("Image path cannot be empty");
    }

    Mat img = imread(path, IMREAD_COLOR);
    if (img.empty()) {
        cerr << "[ERROR] Could not load image from " << path << endl;
        cerr << "[ERROR] Please check that the file exists and is a valid image format" << endl;
        throw ImageLoadError("Failed to load image: " + path);
    }
    return img;
}

Mat PlateProcessor::convertToGrayscale(const Mat& img) {
    if (img.empty()) {
        throw EmptyInputError("Cannot convert an empty image to grayscale");
    }
    if (img.channels() == 1) {
        return img.clone();
    }
    Mat gray;
    cvtColor(img, gray, img.channels() == 4 ? COLOR_BGRA2GRAY : COLOR_BGR2GRAY);
    return gray;
}

Mat PlateProcessor::reduceNoise(const Mat& grayImg, const ProcessingParams& params) {
    if (grayImg.empty()) {
        throw EmptyInputError("Cannot filter an empty image");
    }
    Mat filtered;
    bilateralFilter(grayImg, filtered, params.bilateralDiameter,
                    params.bilateralSigmaColor, params.bilateralSigmaSpace);
    return filtered;
}

Mat PlateProcessor::detectEdges(const Mat& filteredImg, const ProcessingParams& params) {
    if (filteredImg.empty()) {
        throw EmptyInputError("Cannot detect edges on an empty image");
    }
    Mat edges;
    Canny(filteredImg, edges, params.cannyLower, params.cannyUpper, params.cannyAperture);
    return edges;
}

PlateProcessor::LocalizationResult PlateProcessor::localizePlate(const Mat& edgeImg, const ProcessingParams& params) {
    LocalizationResult result;

    vector<Contour> contours = BoundaryTracer::trace(edgeImg);
    if (params.verboseOutput) {
        cout << "[INFO] Traced " << contours.size() << " boundary contours" << endl;
    }

    result.candidates = CandidateRanker::rank(contours, params.topK);
    if (params.verboseOutput && !result.candidates.empty()) {
        cout << "[INFO] Kept " << result.candidates.size() << " candidates, largest area: "
             << result.candidates.front().area() << endl;
    }

    shared_ptr<const CandidateCriterion> criterion;
    if (params.requireConvex) {
        criterion = make_shared<ConvexQuadrilateralCriterion>();
    } else {
        criterion = make_shared<QuadrilateralCriterion>();
    }

    PlateSelector selector(params.polygonEpsilon, criterion);
    Selection selection = selector.select(result.candidates);

    result.found = selection.found();
    result.candidateIndex = selection.candidateIndex;
    result.examined = selection.examined;

    if (result.found) {
        result.location = selection.polygon;
        if (params.verboseOutput) {
            cout << "[INFO] Plate candidate " << result.candidateIndex << " accepted by "
                 << selector.criterion().name() << " criterion at epsilon " << params.polygonEpsilon << endl;
            cout << "[INFO] Corners:";
            for (const auto& p : result.location) {
                cout << " (" << p.y << "," << p.x << ")";
            }
            cout << endl;
        }
        pushDebugContour(edgeImg, result.location.points(), "plate_location", params);
    } else if (params.verboseOutput) {
        cout << "[WARN] No " << selector.criterion().name() << " candidate among "
             << result.examined << " examined (state " << toString(selection.state) << ")" << endl;
    }

    return result;
}

PlateProcessor::ExtractionResult PlateProcessor::extractPlate(const Mat& colorImg, const Mat& grayImg,
                                                              const Polygon& location, const ProcessingParams& params) {
    if (colorImg.size() != grayImg.size()) {
        throw invalid_argument("Color and grayscale images must have the same size");
    }

    ExtractionResult result;
    result.mask = MaskRasterizer::rasterize(location, grayImg.size());
    pushDebugImage(result.mask, "mask", params);

    result.maskedImage = RegionExtractor::maskApply(colorImg, result.mask);
    pushDebugImage(result.maskedImage, "masked", params);

    result.box = RegionExtractor::boundingBoxOf(result.mask);
    result.croppedGray = RegionExtractor::crop(grayImg, result.box);
    pushDebugImage(result.croppedGray, "cropped", params);

    if (params.verboseOutput) {
        cout << "[INFO] Plate bounding box " << result.box << ", crop "
             << result.croppedGray.rows << " x " << result.croppedGray.cols << endl;
    }
    return result;
}

PlateProcessor::PlateResult PlateProcessor::processImage(const string& inputPath, const ProcessingParams& params) {
    if (params.verboseOutput) {
        cout << "[INFO] Starting plate localization pipeline for " << inputPath << endl;
    }

    PlateResult result;
    result.original = loadImage(inputPath);

    // Whatever was pushed is written out even when a later stage throws
    try {
        result.gray = convertToGrayscale(result.original);
        pushDebugImage(result.original, "original", params);
        pushDebugImage(result.gray, "grayscale", params);

        Mat filtered = reduceNoise(result.gray, params);
        pushDebugImage(filtered, "filtered", params);

        result.edges = detectEdges(filtered, params);
        pushDebugImage(result.edges, "edges", params);

        LocalizationResult localization = localizePlate(result.edges, params);
        if (!localization.found) {
            throw NoCandidateFoundError("No quadrilateral plate candidate among the " +
                                        to_string(localization.examined) + " largest contours");
        }
        result.location = localization.location;
        result.extraction = extractPlate(result.original, result.gray, result.location, params);
    } catch (...) {
        flushDebugStack(params);
        throw;
    }

    if (params.verboseOutput) {
        cout << "[INFO] Plate localization pipeline completed successfully." << endl;
    }
    flushDebugStack(params);
    return result;
}

PlateProcessor::PlateResult PlateProcessor::processImage(const string& inputPath) {
    ProcessingParams params;
    return processImage(inputPath, params);
}

string PlateProcessor::readPlateText(const Mat& croppedGray, TextRecognizer& recognizer) {
    if (croppedGray.empty()) {
        throw EmptyInputError("Cannot read text from an empty crop");
    }
    vector<TextDetection> detections = recognizer.readText(croppedGray);
    if (detections.empty()) {
        return "";
    }
    return detections.front().text;
}

Mat PlateProcessor::annotate(const Mat& img, const Polygon& location, const string& text,
                             const ProcessingParams& params) {
    if (img.empty()) {
        throw EmptyInputError("Cannot annotate an empty image");
    }
    if (location.vertexCount() < 3) {
        throw invalid_argument("Annotation needs at least 3 plate corners");
    }

    Mat annotated;
    if (img.channels() == 1) {
        cvtColor(img, annotated, COLOR_GRAY2BGR);
    } else {
        annotated = img.clone();
    }

    const Scalar green(0, 255, 0);
    // First and third corners are opposite in traversal order
    rectangle(annotated, location[0], location[2], green, params.annotationLineThickness);

    if (!text.empty()) {
        Point origin(location[0].x, location[1].y + params.annotationTextOffset);
        putText(annotated, text, origin, FONT_HERSHEY_SIMPLEX, params.annotationFontScale, green,
                params.annotationTextThickness, LINE_AA);
    }
    return annotated;
}

// Debug visualization methods

void PlateProcessor::pushDebugImage(const Mat& image, const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput || image.empty()) return;

    params.debugImageStack.emplace_back(image.clone(), name);
}

void PlateProcessor::pushDebugContour(const Mat& image, const vector<Point>& contour,
                                      const string& name, const ProcessingParams& params) {
    if (!params.enableDebugOutput || image.empty() || contour.empty()) return;

    Mat debugImg;
    if (image.channels() == 1) {
        cvtColor(image, debugImg, COLOR_GRAY2BGR);
    } else {
        debugImg = image.clone();
    }

    vector<vector<Point>> contourVec = {contour};
    drawContours(debugImg, contourVec, 0, Scalar(0, 255, 0), 3);

    params.debugImageStack.emplace_back(debugImg, name);
}

void PlateProcessor::flushDebugStack(const ProcessingParams& params) {
    if (!params.enableDebugOutput || params.debugImageStack.empty()) return;

    cout << "[DEBUG] Flushing " << params.debugImageStack.size() << " debug images..." << endl;

    error_code ec;
    filesystem::create_directories(params.debugOutputPath, ec);
    if (ec) {
        cerr << "[WARN] Could not create debug directory " << params.debugOutputPath
             << ": " << ec.message() << endl;
    }

    // Format: 01_name.jpg, 02_name.jpg, etc.
    for (size_t i = 0; i < params.debugImageStack.size(); i++) {
        const auto& [image, name] = params.debugImageStack[i];

        char indexStr[8];
        snprintf(indexStr, sizeof(indexStr), "%02zu", i + 1);
        string filename = string(indexStr) + "_" + name + ".jpg";
        string fullPath = (filesystem::path(params.debugOutputPath) / filename).string();

        bool success = false;
        try {
            success = imwrite(fullPath, image);
        } catch (const cv::Exception& e) {
            cerr << "[WARN] " << e.what() << endl;
        }
        if (success) {
            cout << "[DEBUG] Saved: " << filename << endl;
        } else {
            cout << "[WARN] Failed to save: " << filename << endl;
        }
    }

    params.debugImageStack.clear();
}

} // namespace PlateTrace
