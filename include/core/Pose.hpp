#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

#include "core/Types.hpp"

namespace core {

/**
 * BlazePose landmark schema. The index of every enumerator is the index the
 * detector emits for that body part; all components address landmarks
 * through this enum.
 */
enum class PoseLandmark : int {
    Nose = 0,
    LeftEyeInner = 1,
    LeftEye = 2,
    LeftEyeOuter = 3,
    RightEyeInner = 4,
    RightEye = 5,
    RightEyeOuter = 6,
    LeftEar = 7,
    RightEar = 8,
    MouthLeft = 9,
    MouthRight = 10,
    LeftShoulder = 11,
    RightShoulder = 12,
    LeftElbow = 13,
    RightElbow = 14,
    LeftWrist = 15,
    RightWrist = 16,
    LeftPinky = 17,
    RightPinky = 18,
    LeftIndex = 19,
    RightIndex = 20,
    LeftThumb = 21,
    RightThumb = 22,
    LeftHip = 23,
    RightHip = 24,
    LeftKnee = 25,
    RightKnee = 26,
    LeftAnkle = 27,
    RightAnkle = 28,
    LeftHeel = 29,
    RightHeel = 30,
    LeftFootIndex = 31,
    RightFootIndex = 32
};

static_assert(static_cast<size_t>(PoseLandmark::RightFootIndex) + 1 == NUM_POSE_LANDMARKS,
              "PoseLandmark must cover every landmark index");

constexpr size_t toIndex(PoseLandmark lm) { return static_cast<size_t>(lm); }

const char* landmarkName(PoseLandmark lm);

/**
 * One detected body point.
 * x/y are normalized to the frame width/height and may lie slightly outside
 * [0, 1]; z is the detector's relative depth.
 */
struct Landmark {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float visibility = 0.0f;

    [[nodiscard]] bool isVisible() const { return visibility > VISIBILITY_THRESHOLD; }
};

/**
 * Immutable set of exactly NUM_POSE_LANDMARKS landmarks for one body in one frame.
 */
class Pose {
public:
    using Landmarks = std::array<Landmark, NUM_POSE_LANDMARKS>;

    Pose() = default;
    explicit Pose(const Landmarks& landmarks) : landmarks_(landmarks) {}

    [[nodiscard]] const Landmark& operator[](PoseLandmark lm) const { return landmarks_[toIndex(lm)]; }
    [[nodiscard]] const Landmark& at(size_t index) const { return landmarks_.at(index); }

    [[nodiscard]] const Landmarks& landmarks() const { return landmarks_; }
    [[nodiscard]] size_t size() const { return landmarks_.size(); }

    [[nodiscard]] Landmarks::const_iterator begin() const { return landmarks_.begin(); }
    [[nodiscard]] Landmarks::const_iterator end() const { return landmarks_.end(); }

    [[nodiscard]] size_t visibleCount() const;

private:
    Landmarks landmarks_{};
};

// Skeletal edge between two landmarks
using Connection = std::pair<PoseLandmark, PoseLandmark>;
using ConnectionList = std::vector<Connection>;

// BlazePose skeleton (35 edges), shared by every render call
extern const ConnectionList POSE_CONNECTIONS;

} // namespace core
