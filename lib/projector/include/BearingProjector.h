#pragma once

#include "BasicFilters.h"
#include "GeoTypes.h"
#include "Geodesy.h"
#include "ProjectionTypes.h"
#include <Eigen/Dense>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

struct ProjectorConfig
{
    float render_radius = 4.0f;                         // placement circle, scene units
    float max_elevation_rad = static_cast<float>(M_PI / 4.0);
    float position_smoothing = 0.3f;                    // (0, 1], 1 = no smoothing
    double earth_radius_m = EARTH_RADIUS_M;
    double degenerate_distance_m = 0.01;                // below this the bearing is meaningless
};

/**
 * @class BearingProjector
 * @brief Turns observer, target and heading into a marker placement.
 *
 * The marker sits on a circle of render_radius around the viewpoint at the
 * relative bearing, lifted by the clamped elevation angle. The placement is
 * low-pass filtered per axis so heading noise does not make it jitter.
 */
class BearingProjector
{
public:
    explicit BearingProjector(const ProjectorConfig &config = ProjectorConfig());

    // Returns false and leaves the previous output untouched if no placement could be made
    bool project(const GeoPoint &observer, const GeoPoint &target, float heading_deg);

    bool hasProjection() const { return m_has_projection; }
    const BearingResult &result() const { return m_result; }
    const Eigen::Vector3f &direction() const { return m_direction_filter.value(); }
    bool isDegenerate() const { return m_degenerate; }

    // Unsmoothed placement for a relative bearing and elevation
    Eigen::Vector3f rawDirection(float relative_bearing_deg, float elevation_rad) const;
    float clampElevation(float elevation_rad) const;

    const ProjectorConfig &getConfig() const { return m_config; }
    void reset();

private:
    ProjectorConfig m_config;

    ExponentialFilter<Eigen::Vector3f> m_direction_filter;
    BearingResult m_result;
    bool m_has_projection;

    // Retained for when observer and target coincide
    float m_last_relative_bearing;
    bool m_has_bearing;
    bool m_degenerate;
};
