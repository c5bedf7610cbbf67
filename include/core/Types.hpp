#pragma once

#include <cstddef>
#include <chrono>

namespace core {

// ============================================================
// Pose Model
// ============================================================

constexpr size_t NUM_POSE_LANDMARKS = 33;  // BlazePose topology
constexpr size_t NUM_POSE_CONNECTIONS = 35;

// Landmarks must be strictly above this visibility to be drawn
constexpr float VISIBILITY_THRESHOLD = 0.5f;

// Pixel coordinates are clamped to this range before reaching OpenCV raster calls
constexpr int MAX_PIXEL_COORD = 1 << 20;

// ============================================================
// Overlay Defaults
// ============================================================

constexpr int DEFAULT_OFFSET_X = 150;
constexpr int DEFAULT_POINT_RADIUS = 3;
constexpr int DEFAULT_LINE_THICKNESS = 2;

constexpr int MAX_ABS_OFFSET_X = 8192;
constexpr int MAX_POINT_RADIUS = 64;
constexpr int MAX_LINE_THICKNESS = 64;

// ============================================================
// Stream Driver
// ============================================================

constexpr int MAX_WORKERS = 16;
constexpr int MAX_IN_FLIGHT = 64;

// Throughput is logged at this interval (debug level)
constexpr std::chrono::seconds STATS_INTERVAL{5};

// Display window poll interval (cv::waitKey), matches ~30 FPS playback
constexpr int DISPLAY_WAIT_MS = 30;

constexpr int DEFAULT_JPEG_QUALITY = 80;

} // namespace core
