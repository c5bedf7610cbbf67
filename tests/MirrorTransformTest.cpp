#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/MirrorTransform.hpp"
#include "TestHelpers.hpp"

using namespace core;

namespace {

MirrorConfig makeConfig(int offset, int width = 640, int height = 480) {
    MirrorConfig config;
    config.offsetX = offset;
    config.frameWidth = width;
    config.frameHeight = height;
    return config;
}

} // namespace

TEST(MirrorTransformTest, ZeroOffsetIsPureReflection) {
    Pose pose = testing_helpers::fullPose();
    Pose mirrored = mirror(pose, makeConfig(0));

    for (size_t i = 0; i < pose.size(); ++i) {
        double originalPixels = pose.at(i).x * 640.0;
        EXPECT_NEAR(mirrored.at(i).x * 640.0, 640.0 - originalPixels, 1e-3) << "landmark " << i;
    }
}

TEST(MirrorTransformTest, OnlyXChanges) {
    Pose pose = testing_helpers::fullPose();
    Pose mirrored = mirror(pose, makeConfig(150));

    for (size_t i = 0; i < pose.size(); ++i) {
        EXPECT_EQ(mirrored.at(i).y, pose.at(i).y);
        EXPECT_EQ(mirrored.at(i).z, pose.at(i).z);
        EXPECT_EQ(mirrored.at(i).visibility, pose.at(i).visibility);
    }
}

TEST(MirrorTransformTest, DoubleReflectionWithSameOffsetRestoresX) {
    Pose pose = testing_helpers::fullPose();

    for (int offset : {0, 1, 150, -150, 639, -640, 2000, -MAX_ABS_OFFSET_X, MAX_ABS_OFFSET_X}) {
        Pose back = mirror(mirror(pose, makeConfig(offset)), makeConfig(offset));
        for (size_t i = 0; i < pose.size(); ++i) {
            EXPECT_NEAR(back.at(i).x, pose.at(i).x, 1e-5) << "offset " << offset << " landmark " << i;
        }
    }
}

TEST(MirrorTransformTest, DoubleReflectionWithInverseOffsetShiftsByTwiceOffset) {
    Pose pose = testing_helpers::singleLandmarkPose(PoseLandmark::Nose, 0.3f, 0.5f);

    for (int offset : {150, -150, 640}) {
        Pose back = mirror(mirror(pose, makeConfig(offset)), makeConfig(-offset));
        double expected = 0.3 - 2.0 * offset / 640.0;
        EXPECT_NEAR(back[PoseLandmark::Nose].x, expected, 1e-5) << "offset " << offset;
    }
}

TEST(MirrorTransformTest, NoseScenarioPixels) {
    Pose pose = testing_helpers::singleLandmarkPose(PoseLandmark::Nose, 0.5f, 0.5f);
    Pose mirrored = mirror(pose, makeConfig(150));

    EXPECT_EQ(toPixel(pose[PoseLandmark::Nose].x, 640), 320);
    EXPECT_EQ(toPixel(mirrored[PoseLandmark::Nose].x, 640), 470);
    EXPECT_EQ(toPixel(mirrored[PoseLandmark::Nose].y, 480), 240);
}

TEST(MirrorTransformTest, DoesNotClipOffscreenResults) {
    Pose pose = testing_helpers::singleLandmarkPose(PoseLandmark::Nose, 0.5f, 0.5f);

    Pose left = mirror(pose, makeConfig(-640));
    EXPECT_FLOAT_EQ(left[PoseLandmark::Nose].x, -0.5f);

    Pose right = mirror(pose, makeConfig(1280));
    EXPECT_FLOAT_EQ(right[PoseLandmark::Nose].x, 2.5f);
}

TEST(MirrorTransformTest, InputIsNotModified) {
    Pose pose = testing_helpers::fullPose();
    Pose copy = pose;
    (void)mirror(pose, makeConfig(150));

    for (size_t i = 0; i < pose.size(); ++i) {
        EXPECT_EQ(pose.at(i).x, copy.at(i).x);
    }
}

TEST(MirrorTransformTest, RejectsEmptyFrameSize) {
    Pose pose = testing_helpers::fullPose();
    EXPECT_THROW((void)mirror(pose, makeConfig(150, 0, 480)), InvalidConfiguration);
    EXPECT_THROW((void)mirror(pose, makeConfig(150, 640, -1)), InvalidConfiguration);
}

TEST(MirrorTransformTest, ToPixelRoundsAndClamps) {
    EXPECT_EQ(toPixel(0.5, 640), 320);
    EXPECT_EQ(toPixel(0.4999, 640), 320);
    EXPECT_EQ(toPixel(-0.5, 640), -320);
    EXPECT_EQ(toPixel(1e9, 640), MAX_PIXEL_COORD);
    EXPECT_EQ(toPixel(-1e9, 640), -MAX_PIXEL_COORD);
}
