#include "PlateTraceAPI.h"
#include "TestRasters.hpp"

#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace PlateTrace::test;

namespace {

struct CallbackLog {
    std::vector<PlateTraceResult> errors;
    std::vector<double> progress;
};

void recordError(PlateTraceResult code, const char* message, void* user_data) {
    EXPECT_NE(message, nullptr);
    static_cast<CallbackLog*>(user_data)->errors.push_back(code);
}

void recordProgress(double progress, const char* stage, void* user_data) {
    EXPECT_NE(stage, nullptr);
    static_cast<CallbackLog*>(user_data)->progress.push_back(progress);
}

class PlateTraceAPITest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeTempDir("api");
        plate_trace_get_default_params(&params_);
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    std::string writeScene() {
        std::string p = path("scene.png");
        EXPECT_TRUE(cv::imwrite(p, plateScene(200, 300, 80, 60, 120, 240)));
        return p;
    }

    std::filesystem::path dir_;
    PlateTraceParams params_;
};

} // namespace

TEST_F(PlateTraceAPITest, DefaultParamsAreValid) {
    EXPECT_EQ(params_.top_k, 10);
    EXPECT_DOUBLE_EQ(params_.polygon_epsilon, 10.0);
    EXPECT_EQ(params_.canny_aperture, 3);
    EXPECT_FALSE(params_.require_convex);
    EXPECT_EQ(plate_trace_validate_params(&params_), PLATE_TRACE_SUCCESS);
}

TEST_F(PlateTraceAPITest, OutOfRangeParamsAreRejected) {
    EXPECT_EQ(plate_trace_validate_params(nullptr), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    PlateTraceParams p = params_;
    p.top_k = 0;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.polygon_epsilon = -1.0;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.canny_lower = 250.0;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.canny_aperture = 4;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.bilateral_diameter = 0;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(PlateTraceAPITest, NaNParamsAreRejected) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    PlateTraceParams p = params_;
    p.bilateral_sigma_color = nan;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.bilateral_sigma_space = nan;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.canny_lower = nan;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.canny_upper = nan;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);

    p = params_;
    p.polygon_epsilon = nan;
    EXPECT_EQ(plate_trace_validate_params(&p), PLATE_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(PlateTraceAPITest, NullArgumentsAreInvalidInput) {
    PlateTraceLocation location;
    EXPECT_EQ(plate_trace_locate_plate(nullptr, nullptr, &location, nullptr, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_INPUT);
    EXPECT_EQ(plate_trace_locate_plate("x.png", nullptr, nullptr, nullptr, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_INPUT);
}

TEST_F(PlateTraceAPITest, MissingFileIsReported) {
    CallbackLog log;
    PlateTraceLocation location;

    PlateTraceResult result = plate_trace_locate_plate(path("missing.png").c_str(), nullptr, &location,
                                                       nullptr, recordError, &log);

    EXPECT_EQ(result, PLATE_TRACE_ERROR_FILE_NOT_FOUND);
    ASSERT_EQ(log.errors.size(), 1u);
    EXPECT_EQ(log.errors[0], PLATE_TRACE_ERROR_FILE_NOT_FOUND);
}

TEST_F(PlateTraceAPITest, NonImageFileFailsToLoad) {
    std::string p = path("notes.png");
    std::ofstream(p) << "not an image";
    PlateTraceLocation location;

    EXPECT_FALSE(plate_trace_is_valid_image_file(p.c_str()));
    EXPECT_EQ(plate_trace_locate_plate(p.c_str(), nullptr, &location, nullptr, nullptr, nullptr),
              PLATE_TRACE_ERROR_IMAGE_LOAD_FAILED);
}

TEST_F(PlateTraceAPITest, InvalidParamsStopBeforeProcessing) {
    std::string scene = writeScene();
    params_.top_k = -2;
    PlateTraceLocation location;

    EXPECT_EQ(plate_trace_locate_plate(scene.c_str(), &params_, &location, nullptr, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_PARAMETERS);
}

TEST_F(PlateTraceAPITest, UniformImageHasNoCandidate) {
    std::string p = path("uniform.png");
    ASSERT_TRUE(cv::imwrite(p, cv::Mat(120, 160, CV_8UC3, cv::Scalar(128, 128, 128))));
    CallbackLog log;
    PlateTraceLocation location;

    PlateTraceResult result = plate_trace_locate_plate(p.c_str(), &params_, &location, nullptr, recordError, &log);

    EXPECT_EQ(result, PLATE_TRACE_ERROR_NO_CANDIDATE);
    ASSERT_EQ(log.errors.size(), 1u);
    EXPECT_EQ(log.errors[0], PLATE_TRACE_ERROR_NO_CANDIDATE);
}

TEST_F(PlateTraceAPITest, LocatesPlateInScene) {
    std::string scene = writeScene();
    CallbackLog log;
    PlateTraceLocation location;

    PlateTraceResult result = plate_trace_locate_plate(scene.c_str(), &params_, &location,
                                                       recordProgress, recordError, &log);

    ASSERT_EQ(result, PLATE_TRACE_SUCCESS);
    EXPECT_TRUE(log.errors.empty());
    ASSERT_FALSE(log.progress.empty());
    EXPECT_DOUBLE_EQ(log.progress.back(), 1.0);

    EXPECT_EQ(location.image_rows, 200);
    EXPECT_EQ(location.image_cols, 300);
    EXPECT_LE(std::abs(location.box.row_min - 80), 2);
    EXPECT_LE(std::abs(location.box.col_min - 60), 2);
    EXPECT_LE(std::abs(location.box.row_max - 120), 2);
    EXPECT_LE(std::abs(location.box.col_max - 240), 2);
    for (const auto& corner : location.corners) {
        EXPECT_GE(corner.row, location.box.row_min);
        EXPECT_LE(corner.row, location.box.row_max);
        EXPECT_GE(corner.col, location.box.col_min);
        EXPECT_LE(corner.col, location.box.col_max);
    }
}

TEST_F(PlateTraceAPITest, WritesRequestedOutputs) {
    std::string scene = writeScene();
    std::string crop = path("crop.png");
    std::string mask = path("mask.png");
    PlateTraceOutputs outputs = {crop.c_str(), mask.c_str(), nullptr, nullptr};
    PlateTraceLocation location;

    ASSERT_EQ(plate_trace_process_image_to_files(scene.c_str(), &outputs, &params_, &location,
                                                 nullptr, nullptr, nullptr),
              PLATE_TRACE_SUCCESS);

    cv::Mat cropImg = cv::imread(crop, cv::IMREAD_UNCHANGED);
    cv::Mat maskImg = cv::imread(mask, cv::IMREAD_UNCHANGED);
    ASSERT_FALSE(cropImg.empty());
    ASSERT_FALSE(maskImg.empty());
    EXPECT_EQ(cropImg.channels(), 1);
    EXPECT_EQ(cropImg.rows, location.box.row_max - location.box.row_min + 1);
    EXPECT_EQ(cropImg.cols, location.box.col_max - location.box.col_min + 1);
    EXPECT_EQ(maskImg.size(), cv::Size(300, 200));
    EXPECT_FALSE(std::filesystem::exists(path("masked.png")));
}

TEST_F(PlateTraceAPITest, VerboseOutputEnablesPipelineLogging) {
    std::string scene = writeScene();
    PlateTraceLocation location;

    EXPECT_FALSE(params_.verbose_output);
    ::testing::internal::CaptureStdout();
    ASSERT_EQ(plate_trace_locate_plate(scene.c_str(), &params_, &location, nullptr, nullptr, nullptr),
              PLATE_TRACE_SUCCESS);
    std::string quiet = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(quiet.find("[INFO]"), std::string::npos);

    params_.verbose_output = true;
    ::testing::internal::CaptureStdout();
    ASSERT_EQ(plate_trace_locate_plate(scene.c_str(), &params_, &location, nullptr, nullptr, nullptr),
              PLATE_TRACE_SUCCESS);
    std::string verbose = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(verbose.find("[INFO] Starting plate localization pipeline"), std::string::npos);
    EXPECT_NE(verbose.find("[INFO] Plate candidate"), std::string::npos);
}

TEST_F(PlateTraceAPITest, DebugOutputWritesWholeNumberedStack) {
    std::string scene = writeScene();
    std::string crop = path("crop.png");
    PlateTraceOutputs outputs = {crop.c_str(), nullptr, nullptr, nullptr};
    params_.enable_debug_output = true;

    // Debug images land in ./debug/ under the working directory
    std::filesystem::path previous = std::filesystem::current_path();
    std::filesystem::current_path(dir_);
    PlateTraceResult result = plate_trace_process_image_to_files(scene.c_str(), &outputs, &params_, nullptr,
                                                                 nullptr, nullptr, nullptr);
    std::filesystem::current_path(previous);

    ASSERT_EQ(result, PLATE_TRACE_SUCCESS);
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug" / "01_original.jpg"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug" / "02_grayscale.jpg"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug" / "04_edges.jpg"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "debug" / "05_plate_location.jpg"));
}

TEST_F(PlateTraceAPITest, ProcessingNeedsAnOutput) {
    std::string scene = writeScene();
    PlateTraceOutputs outputs = {nullptr, nullptr, nullptr, nullptr};

    EXPECT_EQ(plate_trace_process_image_to_files(scene.c_str(), &outputs, nullptr, nullptr, nullptr, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_INPUT);
}

TEST_F(PlateTraceAPITest, SavesOutlineAsDXF) {
    PlateTraceLocation location = {};
    location.corners[0] = {20, 10};
    location.corners[1] = {50, 10};
    location.corners[2] = {50, 80};
    location.corners[3] = {20, 80};
    std::string dxf = path("plate.dxf");

    ASSERT_EQ(plate_trace_save_location_to_dxf(&location, dxf.c_str(), 2.0, nullptr, nullptr), PLATE_TRACE_SUCCESS);

    std::ifstream in(dxf);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_NE(contents.str().find("LWPOLYLINE"), std::string::npos);
    EXPECT_NE(contents.str().find("Plate"), std::string::npos);

    // The entity layer is declared in the TABLES section
    std::string text = contents.str();
    size_t tables = text.find("TABLES");
    size_t entities = text.find("ENTITIES");
    ASSERT_NE(tables, std::string::npos);
    ASSERT_NE(entities, std::string::npos);
    EXPECT_NE(text.substr(tables, entities - tables).find("\nPlate"), std::string::npos);
}

TEST_F(PlateTraceAPITest, DXFNeedsPositiveScale) {
    PlateTraceLocation location = {};
    std::string dxf = path("plate.dxf");
    EXPECT_EQ(plate_trace_save_location_to_dxf(&location, dxf.c_str(), 0.0, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_INPUT);
    EXPECT_EQ(plate_trace_save_location_to_dxf(nullptr, dxf.c_str(), 1.0, nullptr, nullptr),
              PLATE_TRACE_ERROR_INVALID_INPUT);
}

TEST(PlateTraceAPIInfoTest, ErrorMessagesAndVersion) {
    EXPECT_STREQ(plate_trace_get_version(), "1.0.0");
    EXPECT_STREQ(plate_trace_get_error_message(PLATE_TRACE_SUCCESS), "Success");
    EXPECT_STRNE(plate_trace_get_error_message(PLATE_TRACE_ERROR_NO_CANDIDATE), "Unknown error");
    EXPECT_STREQ(plate_trace_get_error_message(static_cast<PlateTraceResult>(-99)), "Unknown error");
}
