#pragma once

#include <opencv2/core.hpp>
#include <array>
#include <string>
#include <vector>

namespace PlateTrace {

// One recognized text region, in crop coordinates
struct TextDetection {
    std::array<cv::Point, 4> quad;
    std::string text;
    double confidence = 0.0;  // 0..1
};

// Contract for an external OCR engine fed with the cropped grayscale plate.
// Detections come back in reading order.
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;
    virtual std::vector<TextDetection> readText(const cv::Mat& grayCrop) = 0;
};

} // namespace PlateTrace
