#pragma once
#include <Eigen/Dense>
#include <cstdint>

struct BearingResult
{
    float relative_bearing_deg = 0.0f; // (-180, 180], 0 = straight ahead
    float elevation_rad = 0.0f;        // clamped to the configured maximum
    double horizontal_distance_m = 0.0;
    double total_distance_m = 0.0;
};

/// <summary>
/// Latest output of the engine. available == false until both a position
/// fix and a heading have been seen and a bearing could be established.
/// </summary>
struct Projection
{
    uint64_t timestamp = 0;
    bool available = false;
    BearingResult bearing;
    Eigen::Vector3f direction = Eigen::Vector3f::Zero(); // marker position, -Z forward, +Y up
};

// Numbers a text overlay or compass strip needs
struct DisplayReadout
{
    bool available = false;
    long rounded_distance_m = 0;
    float heading_deg = 0.0f;
    float compass_offset_px = 0.0f;
};
