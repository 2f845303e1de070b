#pragma once
#include <cstdint>
#include <optional>

// Geographic position. Degrees for latitude/longitude, metres for altitude.
struct GeoPoint
{
    double latitude = 0.0;
    double longitude = 0.0;
    double altitude = 0.0;

    GeoPoint() = default;
    GeoPoint(double lat, double lon, double alt = 0.0) : latitude(lat), longitude(lon), altitude(alt) {}

    bool operator==(const GeoPoint &other) const
    {
        return latitude == other.latitude && longitude == other.longitude && altitude == other.altitude;
    }
};

/// <summary>
/// Raw orientation event as reported by the device. Any field may be missing.
/// alpha is device yaw, beta/gamma are pitch and roll, compass_heading is the
/// platform supplied heading when one exists.
/// </summary>
struct HeadingSample
{
    uint64_t timestamp = 0;
    std::optional<float> alpha;
    std::optional<float> beta;
    std::optional<float> gamma;
    std::optional<float> compass_heading;
};
