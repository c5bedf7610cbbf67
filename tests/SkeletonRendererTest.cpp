#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

#include "core/Errors.hpp"
#include "core/SkeletonRenderer.hpp"
#include "TestHelpers.hpp"

using namespace core;
using testing_helpers::identical;

namespace {

cv::Mat blackFrame(int width = 640, int height = 480) {
    return cv::Mat::zeros(height, width, CV_8UC3);
}

} // namespace

TEST(SkeletonRendererTest, DrawsNoseAtPixelCenter) {
    cv::Mat frame = blackFrame();
    Pose pose = testing_helpers::singleLandmarkPose(PoseLandmark::Nose, 0.5f, 0.5f);
    RenderStyle style;

    render(frame, pose, POSE_CONNECTIONS, style);

    EXPECT_EQ(frame.at<cv::Vec3b>(240, 320), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(frame.at<cv::Vec3b>(240, 320 + style.pointRadius + 2), cv::Vec3b(0, 0, 0));
}

TEST(SkeletonRendererTest, IsDeterministic) {
    cv::Mat a = testing_helpers::patternImage(320, 240, 1);
    cv::Mat b = a.clone();
    Pose pose = testing_helpers::fullPose();

    render(a, pose, POSE_CONNECTIONS, RenderStyle{});
    render(b, pose, POSE_CONNECTIONS, RenderStyle{});

    EXPECT_TRUE(identical(a, b));
}

TEST(SkeletonRendererTest, SkipsConnectionWithInvisibleEnd) {
    auto lms = testing_helpers::hiddenLandmarks();
    lms[toIndex(PoseLandmark::LeftShoulder)] = Landmark{0.25f, 0.5f, 0.0f, 0.9f};
    // Exactly at the threshold counts as not visible
    lms[toIndex(PoseLandmark::RightShoulder)] = Landmark{0.75f, 0.5f, 0.0f, VISIBILITY_THRESHOLD};
    Pose pose(lms);

    RenderStyle style;
    cv::Mat frame = blackFrame();
    render(frame, pose, POSE_CONNECTIONS, style);

    // Only the left shoulder circle may appear
    cv::Mat expected = blackFrame();
    cv::circle(expected, cv::Point(160, 240), style.pointRadius, style.pointColor, cv::FILLED);
    EXPECT_TRUE(identical(frame, expected));
}

TEST(SkeletonRendererTest, DrawsConnectionBetweenVisibleEnds) {
    auto lms = testing_helpers::hiddenLandmarks();
    lms[toIndex(PoseLandmark::LeftShoulder)] = Landmark{0.25f, 0.5f, 0.0f, 0.9f};
    lms[toIndex(PoseLandmark::RightShoulder)] = Landmark{0.75f, 0.5f, 0.0f, 0.9f};
    Pose pose(lms);

    cv::Mat frame = blackFrame();
    render(frame, pose, POSE_CONNECTIONS, RenderStyle{});

    // Midpoint of the shoulder line is red, endpoints are covered by blue circles
    EXPECT_EQ(frame.at<cv::Vec3b>(240, 320), cv::Vec3b(0, 0, 255));
    EXPECT_EQ(frame.at<cv::Vec3b>(240, 160), cv::Vec3b(255, 0, 0));
    EXPECT_EQ(frame.at<cv::Vec3b>(240, 480), cv::Vec3b(255, 0, 0));
}

TEST(SkeletonRendererTest, OffscreenLandmarksAreClipped) {
    auto lms = testing_helpers::hiddenLandmarks();
    lms[toIndex(PoseLandmark::LeftHip)] = Landmark{-3.0f, 0.5f, 0.0f, 1.0f};
    lms[toIndex(PoseLandmark::RightHip)] = Landmark{5.0f, -2.0f, 0.0f, 1.0f};
    lms[toIndex(PoseLandmark::LeftKnee)] = Landmark{1e9f, 1e9f, 0.0f, 1.0f};
    Pose pose(lms);

    cv::Mat frame = blackFrame();
    EXPECT_NO_THROW(render(frame, pose, POSE_CONNECTIONS, RenderStyle{}));
}

TEST(SkeletonRendererTest, IgnoresNonFiniteCoordinates) {
    auto lms = testing_helpers::hiddenLandmarks();
    lms[toIndex(PoseLandmark::Nose)] = Landmark{std::numeric_limits<float>::quiet_NaN(), 0.5f, 0.0f, 1.0f};
    lms[toIndex(PoseLandmark::LeftEar)] = Landmark{0.5f, std::numeric_limits<float>::infinity(), 0.0f, 1.0f};
    Pose pose(lms);

    cv::Mat frame = blackFrame();
    render(frame, pose, POSE_CONNECTIONS, RenderStyle{});

    EXPECT_EQ(cv::countNonZero(frame.reshape(1)), 0);
}

TEST(SkeletonRendererTest, EmptyConnectionListDrawsPointsOnly) {
    Pose pose = testing_helpers::fullPose();
    RenderStyle style;
    style.pointColor = cv::Scalar(0, 255, 0);

    cv::Mat frame = blackFrame();
    render(frame, pose, ConnectionList{}, style);

    std::vector<cv::Mat> channels;
    cv::split(frame, channels);
    EXPECT_EQ(cv::countNonZero(channels[2]), 0);  // No red lines
    EXPECT_GT(cv::countNonZero(channels[1]), 0);
}

TEST(SkeletonRendererTest, RejectsUnsupportedBuffers) {
    Pose pose = testing_helpers::fullPose();

    cv::Mat empty;
    EXPECT_THROW(render(empty, pose, POSE_CONNECTIONS, RenderStyle{}), std::invalid_argument);

    cv::Mat gray = cv::Mat::zeros(480, 640, CV_8UC1);
    EXPECT_THROW(render(gray, pose, POSE_CONNECTIONS, RenderStyle{}), std::invalid_argument);
}

TEST(SkeletonRendererTest, StyleValidation) {
    RenderStyle style;
    EXPECT_NO_THROW(style.validate());

    style.pointRadius = 0;
    EXPECT_THROW(style.validate(), InvalidConfiguration);

    style.pointRadius = MAX_POINT_RADIUS;
    style.lineThickness = MAX_LINE_THICKNESS + 1;
    EXPECT_THROW(style.validate(), InvalidConfiguration);

    style.lineThickness = -2;
    EXPECT_THROW(style.validate(), InvalidConfiguration);
}
