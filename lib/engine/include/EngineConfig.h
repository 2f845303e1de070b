#pragma once
#include "BearingProjector.h"

// Defaults. Heading and placement smoothing are tuned for phone-grade
// magnetometers sampled at 30-60 Hz.
constexpr float DEFAULT_HEADING_SMOOTHING = 0.2f;
constexpr float DEFAULT_POSITION_SMOOTHING = 0.3f;
constexpr float DEFAULT_RENDER_RADIUS = 4.0f;
constexpr float DEFAULT_MAX_ELEVATION_RAD = static_cast<float>(M_PI / 4.0);
constexpr double DEFAULT_DEGENERATE_DISTANCE_M = 0.01;
constexpr float DEFAULT_COMPASS_PIXELS_PER_DEGREE = 1.0f;

struct EngineConfig
{
    float heading_smoothing = DEFAULT_HEADING_SMOOTHING;
    float position_smoothing = DEFAULT_POSITION_SMOOTHING;
    float max_elevation_rad = DEFAULT_MAX_ELEVATION_RAD;
    float render_radius = DEFAULT_RENDER_RADIUS;
    double earth_radius_m = EARTH_RADIUS_M;
    double degenerate_distance_m = DEFAULT_DEGENERATE_DISTANCE_M;
    float compass_pixels_per_degree = DEFAULT_COMPASS_PIXELS_PER_DEGREE;

    // Copy with every out-of-range value replaced by its default.
    // Each replacement is reported on stderr.
    EngineConfig sanitized() const;

    ProjectorConfig projectorConfig() const;
};
