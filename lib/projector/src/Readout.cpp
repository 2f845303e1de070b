#include "Readout.h"
#include <cmath>

float compassStripOffset(float heading_deg, float pixels_per_degree)
{
    const float strip_width = 360.0f * pixels_per_degree;
    if (!std::isfinite(heading_deg) || !(strip_width > 0.0f))
        return 0.0f;

    float offset = std::fmod(heading_deg * pixels_per_degree, strip_width);
    if (offset < 0.0f)
        offset += strip_width;
    return offset;
}

DisplayReadout makeReadout(const Projection &projection, float heading_deg, float pixels_per_degree)
{
    DisplayReadout readout;
    readout.heading_deg = heading_deg;
    readout.compass_offset_px = compassStripOffset(heading_deg, pixels_per_degree);

    if (projection.available)
    {
        readout.available = true;
        readout.rounded_distance_m = std::lround(projection.bearing.total_distance_m);
    }
    return readout;
}
