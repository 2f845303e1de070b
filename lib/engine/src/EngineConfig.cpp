#include "EngineConfig.h"

#include <cmath>
#include <iostream>

template <typename T>
static void replaceIf(bool invalid, T &value, T fallback, const char *name)
{
    if (!invalid)
        return;
    std::cerr << "[EngineConfig] " << name << " = " << value << " out of range, using " << fallback << std::endl;
    value = fallback;
}

EngineConfig EngineConfig::sanitized() const
{
    EngineConfig config = *this;

    replaceIf(!(config.heading_smoothing > 0.0f && config.heading_smoothing <= 1.0f),
              config.heading_smoothing, DEFAULT_HEADING_SMOOTHING, "heading_smoothing");
    replaceIf(!(config.position_smoothing > 0.0f && config.position_smoothing <= 1.0f),
              config.position_smoothing, DEFAULT_POSITION_SMOOTHING, "position_smoothing");
    replaceIf(!(config.max_elevation_rad >= 0.0f && config.max_elevation_rad <= static_cast<float>(M_PI / 2.0)),
              config.max_elevation_rad, DEFAULT_MAX_ELEVATION_RAD, "max_elevation_rad");
    replaceIf(!(config.render_radius > 0.0f && std::isfinite(config.render_radius)),
              config.render_radius, DEFAULT_RENDER_RADIUS, "render_radius");
    replaceIf(!(config.earth_radius_m > 0.0 && std::isfinite(config.earth_radius_m)),
              config.earth_radius_m, EARTH_RADIUS_M, "earth_radius_m");
    replaceIf(!(config.degenerate_distance_m >= 0.0 && std::isfinite(config.degenerate_distance_m)),
              config.degenerate_distance_m, DEFAULT_DEGENERATE_DISTANCE_M, "degenerate_distance_m");
    replaceIf(!(config.compass_pixels_per_degree > 0.0f && std::isfinite(config.compass_pixels_per_degree)),
              config.compass_pixels_per_degree, DEFAULT_COMPASS_PIXELS_PER_DEGREE, "compass_pixels_per_degree");

    return config;
}

ProjectorConfig EngineConfig::projectorConfig() const
{
    ProjectorConfig projector;
    projector.render_radius = render_radius;
    projector.max_elevation_rad = max_elevation_rad;
    projector.position_smoothing = position_smoothing;
    projector.earth_radius_m = earth_radius_m;
    projector.degenerate_distance_m = degenerate_distance_m;
    return projector;
}
