#include "BearingProjector.h"

#include <algorithm>
#include <cmath>

BearingProjector::BearingProjector(const ProjectorConfig &config)
    : m_config(config),
      m_direction_filter(config.position_smoothing),
      m_result(),
      m_has_projection(false),
      m_last_relative_bearing(0.0f),
      m_has_bearing(false),
      m_degenerate(false)
{
    if (!(config.position_smoothing > 0.0f && config.position_smoothing <= 1.0f))
        m_direction_filter.setAlpha(1.0f);
}

bool BearingProjector::project(const GeoPoint &observer, const GeoPoint &target, float heading_deg)
{
    if (!std::isfinite(heading_deg))
        return false;

    const double horizontal = geodesy::distance(observer, target, m_config.earth_radius_m);
    const double altitude_diff = target.altitude - observer.altitude;
    if (!std::isfinite(horizontal) || !std::isfinite(altitude_diff))
        return false;

    // Relative bearing, unless we are standing on the target
    float relative_bearing;
    m_degenerate = horizontal < m_config.degenerate_distance_m;
    if (m_degenerate)
    {
        if (!m_has_bearing)
            return false;
        relative_bearing = m_last_relative_bearing;
    }
    else
    {
        const double bearing = geodesy::initialBearing(observer, target);
        relative_bearing = static_cast<float>(geodesy::wrap180(bearing - heading_deg));
        // -179.9999999 can narrow to -180
        if (relative_bearing <= -180.0f)
            relative_bearing = 180.0f;
        m_last_relative_bearing = relative_bearing;
        m_has_bearing = true;
    }

    // Limited so close targets don't point straight up
    const float elevation = clampElevation(static_cast<float>(std::atan2(altitude_diff, horizontal)));

    m_direction_filter.apply(rawDirection(relative_bearing, elevation));

    m_result.relative_bearing_deg = relative_bearing;
    m_result.elevation_rad = elevation;
    m_result.horizontal_distance_m = horizontal;
    m_result.total_distance_m = geodesy::totalDistance3D(horizontal, altitude_diff);
    m_has_projection = true;
    return true;
}

Eigen::Vector3f BearingProjector::rawDirection(float relative_bearing_deg, float elevation_rad) const
{
    const float angle = static_cast<float>(geodesy::toRadians(relative_bearing_deg));
    const float radius = m_config.render_radius;

    return Eigen::Vector3f(radius * std::sin(angle),
                           radius * std::sin(elevation_rad),
                           -radius * std::cos(angle));
}

float BearingProjector::clampElevation(float elevation_rad) const
{
    const float limit = std::fabs(m_config.max_elevation_rad);
    return std::clamp(elevation_rad, -limit, limit);
}

void BearingProjector::reset()
{
    m_direction_filter.reset();
    m_result = BearingResult();
    m_has_projection = false;
    m_last_relative_bearing = 0.0f;
    m_has_bearing = false;
    m_degenerate = false;
}
