#pragma once

#include "Geometry.hpp"
#include "TextRecognizer.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <utility>
#include <vector>

namespace PlateTrace {

class PlateProcessor {
public:
    struct ProcessingParams {
        // Noise reduction (bilateral filter)
        int bilateralDiameter = 17;
        double bilateralSigmaColor = 17.0;
        double bilateralSigmaSpace = 11.0;

        // Edge detection parameters
        double cannyLower = 30.0;
        double cannyUpper = 200.0;
        int cannyAperture = 3;

        // Candidate ranking and selection
        int topK = 10;                   // Largest contours kept for selection
        double polygonEpsilon = 10.0;    // Pixels; tune with image resolution
        bool requireConvex = false;      // Reject non-convex 4-gons

        // Annotation
        int annotationTextOffset = 60;   // Text baseline below the second corner
        double annotationFontScale = 1.0;
        int annotationLineThickness = 3;
        int annotationTextThickness = 2;

        // Debug visualization
        bool enableDebugOutput = false;
        bool verboseOutput = false;      // Console progress lines
        std::string debugOutputPath = "./debug/";

        // Debug image stack (for automatic numbering)
        mutable std::vector<std::pair<cv::Mat, std::string>> debugImageStack;
    };

    struct LocalizationResult {
        bool found = false;
        Polygon location;                 // 4 ordered corners when found
        std::vector<Contour> candidates;  // ranked, at most topK
        int candidateIndex = -1;
        int examined = 0;
    };

    struct ExtractionResult {
        cv::Mat mask;          // CV_8UC1, 0/255, image sized
        cv::Mat maskedImage;   // color image with everything outside zeroed
        BoundingBox box;
        cv::Mat croppedGray;   // handed to OCR
    };

    struct PlateResult {
        cv::Mat original;
        cv::Mat gray;
        cv::Mat edges;
        Polygon location;
        ExtractionResult extraction;
    };

    // Upstream stages
    static cv::Mat loadImage(const std::string& path);
    static cv::Mat convertToGrayscale(const cv::Mat& img);
    static cv::Mat reduceNoise(const cv::Mat& grayImg, const ProcessingParams& params);
    static cv::Mat detectEdges(const cv::Mat& filteredImg, const ProcessingParams& params);

    // Trace, rank and select on an edge raster. Never throws for "no plate";
    // callers may retry with another epsilon or topK on the same edges.
    static LocalizationResult localizePlate(const cv::Mat& edgeImg, const ProcessingParams& params);

    static ExtractionResult extractPlate(const cv::Mat& colorImg, const cv::Mat& grayImg,
                                         const Polygon& location, const ProcessingParams& params);

    // Whole pipeline from a file. Throws NoCandidateFoundError when no
    // candidate passes selection.
    static PlateResult processImage(const std::string& inputPath, const ProcessingParams& params);
    static PlateResult processImage(const std::string& inputPath);

    // Text of the first detection, empty when the recognizer finds nothing
    static std::string readPlateText(const cv::Mat& croppedGray, TextRecognizer& recognizer);

    // Copy of img with the plate rectangle and, if non-empty, the text drawn on it
    static cv::Mat annotate(const cv::Mat& img, const Polygon& location, const std::string& text,
                            const ProcessingParams& params);

    // Debug stack
    static void pushDebugImage(const cv::Mat& image, const std::string& name, const ProcessingParams& params);
    static void pushDebugContour(const cv::Mat& image, const std::vector<cv::Point>& contour,
                                 const std::string& name, const ProcessingParams& params);
    static void flushDebugStack(const ProcessingParams& params);
};

} // namespace PlateTrace
