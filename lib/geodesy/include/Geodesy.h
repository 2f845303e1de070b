#ifndef GEODESY_H
#define GEODESY_H

#include "GeoTypes.h"

// Spherical earth model
constexpr double EARTH_RADIUS_M = 6371000.0;

namespace geodesy
{
double toRadians(double degrees);
double toDegrees(double radians);

// Wraps into [0, 360)
double wrap360(double degrees);
// Wraps into (-180, 180]
double wrap180(double degrees);
// Signed short-arc delta that takes `from` onto `to`, in [-180, 180]
double shortestAngleDiff(double to, double from);

bool isValid(const GeoPoint &point);

/**
 * Haversine great-circle distance in metres. Altitude is ignored.
 */
double distance(const GeoPoint &a, const GeoPoint &b, double radius = EARTH_RADIUS_M);

/**
 * Forward azimuth from a to b in degrees, [0, 360) clockwise from north.
 * Coincident points give an arbitrary bearing; callers check distance first.
 */
double initialBearing(const GeoPoint &a, const GeoPoint &b);

// Straight-line correction of a horizontal distance by an altitude difference
double totalDistance3D(double horizontal, double altitude_diff);
} // namespace geodesy

#endif // GEODESY_H
