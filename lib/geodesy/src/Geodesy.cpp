#include "Geodesy.h"
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace geodesy
{

double toRadians(double degrees)
{
    return degrees * M_PI / 180.0;
}

double toDegrees(double radians)
{
    return radians * 180.0 / M_PI;
}

double wrap360(double degrees)
{
    double wrapped = std::fmod(degrees, 360.0);
    if (wrapped < 0.0)
        wrapped += 360.0;
    // fmod of a tiny negative number can round back up to 360
    if (wrapped >= 360.0)
        wrapped -= 360.0;
    return wrapped;
}

double wrap180(double degrees)
{
    double wrapped = wrap360(degrees);
    if (wrapped > 180.0)
        wrapped -= 360.0;
    return wrapped;
}

double shortestAngleDiff(double to, double from)
{
    double diff = to - from;
    if (diff > 180.0)
        diff -= 360.0;
    else if (diff < -180.0)
        diff += 360.0;
    return diff;
}

bool isValid(const GeoPoint &point)
{
    if (!std::isfinite(point.latitude) || !std::isfinite(point.longitude))
        return false;
    return point.latitude >= -90.0 && point.latitude <= 90.0 &&
           point.longitude >= -180.0 && point.longitude <= 180.0;
}

double distance(const GeoPoint &a, const GeoPoint &b, double radius)
{
    const double lat_a = toRadians(a.latitude);
    const double lat_b = toRadians(b.latitude);
    const double d_lat = toRadians(b.latitude - a.latitude);
    const double d_lon = toRadians(b.longitude - a.longitude);

    const double sin_dlat = std::sin(d_lat / 2.0);
    const double sin_dlon = std::sin(d_lon / 2.0);

    double h = sin_dlat * sin_dlat + std::cos(lat_a) * std::cos(lat_b) * sin_dlon * sin_dlon;
    // Rounding can push h just outside [0,1] for antipodal points
    if (h > 1.0)
        h = 1.0;
    else if (h < 0.0)
        h = 0.0;

    return 2.0 * radius * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

double initialBearing(const GeoPoint &a, const GeoPoint &b)
{
    const double lat_a = toRadians(a.latitude);
    const double lat_b = toRadians(b.latitude);
    const double d_lon = toRadians(b.longitude - a.longitude);

    const double y = std::sin(d_lon) * std::cos(lat_b);
    const double x = std::cos(lat_a) * std::sin(lat_b) - std::sin(lat_a) * std::cos(lat_b) * std::cos(d_lon);

    return wrap360(toDegrees(std::atan2(y, x)) + 360.0);
}

double totalDistance3D(double horizontal, double altitude_diff)
{
    return std::sqrt(horizontal * horizontal + altitude_diff * altitude_diff);
}

} // namespace geodesy
