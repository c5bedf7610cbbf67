#include "core/Pose.hpp"

#include <algorithm>

namespace core {

namespace {

constexpr std::array<const char*, NUM_POSE_LANDMARKS> LANDMARK_NAMES = {
    "nose",
    "left_eye_inner", "left_eye", "left_eye_outer",
    "right_eye_inner", "right_eye", "right_eye_outer",
    "left_ear", "right_ear",
    "mouth_left", "mouth_right",
    "left_shoulder", "right_shoulder",
    "left_elbow", "right_elbow",
    "left_wrist", "right_wrist",
    "left_pinky", "right_pinky",
    "left_index", "right_index",
    "left_thumb", "right_thumb",
    "left_hip", "right_hip",
    "left_knee", "right_knee",
    "left_ankle", "right_ankle",
    "left_heel", "right_heel",
    "left_foot_index", "right_foot_index"
};

} // namespace

const char* landmarkName(PoseLandmark lm) {
    return LANDMARK_NAMES[toIndex(lm)];
}

size_t Pose::visibleCount() const {
    return static_cast<size_t>(std::count_if(landmarks_.begin(), landmarks_.end(),
                                             [](const Landmark& lm) { return lm.isVisible(); }));
}

using L = PoseLandmark;

const ConnectionList POSE_CONNECTIONS = {
    // Face
    {L::Nose, L::LeftEyeInner}, {L::LeftEyeInner, L::LeftEye}, {L::LeftEye, L::LeftEyeOuter},
    {L::LeftEyeOuter, L::LeftEar},
    {L::Nose, L::RightEyeInner}, {L::RightEyeInner, L::RightEye}, {L::RightEye, L::RightEyeOuter},
    {L::RightEyeOuter, L::RightEar},
    {L::MouthLeft, L::MouthRight},

    // Torso
    {L::LeftShoulder, L::RightShoulder},
    {L::LeftShoulder, L::LeftHip}, {L::RightShoulder, L::RightHip},
    {L::LeftHip, L::RightHip},

    // Left arm + hand
    {L::LeftShoulder, L::LeftElbow}, {L::LeftElbow, L::LeftWrist},
    {L::LeftWrist, L::LeftPinky}, {L::LeftWrist, L::LeftIndex}, {L::LeftWrist, L::LeftThumb},
    {L::LeftPinky, L::LeftIndex},

    // Right arm + hand
    {L::RightShoulder, L::RightElbow}, {L::RightElbow, L::RightWrist},
    {L::RightWrist, L::RightPinky}, {L::RightWrist, L::RightIndex}, {L::RightWrist, L::RightThumb},
    {L::RightPinky, L::RightIndex},

    // Left leg
    {L::LeftHip, L::LeftKnee}, {L::LeftKnee, L::LeftAnkle},
    {L::LeftAnkle, L::LeftHeel}, {L::LeftHeel, L::LeftFootIndex}, {L::LeftAnkle, L::LeftFootIndex},

    // Right leg
    {L::RightHip, L::RightKnee}, {L::RightKnee, L::RightAnkle},
    {L::RightAnkle, L::RightHeel}, {L::RightHeel, L::RightFootIndex}, {L::RightAnkle, L::RightFootIndex}
};

} // namespace core
