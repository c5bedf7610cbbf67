#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <string>

#include "core/Pose.hpp"
#include "TestHelpers.hpp"

using namespace core;

TEST(PoseTest, SchemaCoversAllLandmarks) {
    EXPECT_EQ(toIndex(PoseLandmark::Nose), 0u);
    EXPECT_EQ(toIndex(PoseLandmark::LeftShoulder), 11u);
    EXPECT_EQ(toIndex(PoseLandmark::RightHip), 24u);
    EXPECT_EQ(toIndex(PoseLandmark::RightFootIndex), NUM_POSE_LANDMARKS - 1);
    EXPECT_EQ(Pose().size(), NUM_POSE_LANDMARKS);
}

TEST(PoseTest, LandmarkNames) {
    EXPECT_STREQ(landmarkName(PoseLandmark::Nose), "nose");
    EXPECT_STREQ(landmarkName(PoseLandmark::LeftElbow), "left_elbow");
    EXPECT_STREQ(landmarkName(PoseLandmark::RightFootIndex), "right_foot_index");
}

TEST(PoseTest, ConnectionGraphIsWellFormed) {
    ASSERT_EQ(POSE_CONNECTIONS.size(), NUM_POSE_CONNECTIONS);

    std::set<std::pair<size_t, size_t>> seen;
    for (const auto& conn : POSE_CONNECTIONS) {
        size_t a = toIndex(conn.first);
        size_t b = toIndex(conn.second);
        EXPECT_LT(a, NUM_POSE_LANDMARKS);
        EXPECT_LT(b, NUM_POSE_LANDMARKS);
        EXPECT_NE(a, b);
        // Unordered pairs must be unique
        EXPECT_TRUE(seen.insert({std::min(a, b), std::max(a, b)}).second)
            << landmarkName(conn.first) << " - " << landmarkName(conn.second);
    }
}

TEST(PoseTest, VisibilityThresholdIsExclusive) {
    EXPECT_FALSE((Landmark{0.5f, 0.5f, 0.0f, VISIBILITY_THRESHOLD}).isVisible());
    EXPECT_TRUE((Landmark{0.5f, 0.5f, 0.0f, 0.51f}).isVisible());
    EXPECT_FALSE((Landmark{0.5f, 0.5f, 0.0f, 0.0f}).isVisible());
}

TEST(PoseTest, AccessByEnumAndIndex) {
    Pose pose = testing_helpers::singleLandmarkPose(PoseLandmark::LeftWrist, 0.25f, 0.75f);

    EXPECT_FLOAT_EQ(pose[PoseLandmark::LeftWrist].x, 0.25f);
    EXPECT_FLOAT_EQ(pose.at(15).y, 0.75f);
    EXPECT_EQ(pose.visibleCount(), 1u);
    EXPECT_THROW((void)pose.at(NUM_POSE_LANDMARKS), std::out_of_range);
}
