#pragma once
#include "ProjectionTypes.h"

// Horizontal shift of a scrolling compass strip, wraps every 360 degrees
float compassStripOffset(float heading_deg, float pixels_per_degree);

DisplayReadout makeReadout(const Projection &projection, float heading_deg, float pixels_per_degree);
