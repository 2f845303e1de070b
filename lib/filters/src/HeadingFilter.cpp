#include "HeadingFilter.h"
#include "Geodesy.h"

#include <cmath>

static bool isUsable(const std::optional<float> &angle)
{
    return angle.has_value() && std::isfinite(*angle);
}

// Narrowing can round 359.99999 up to 360
static float toCircle(double degrees)
{
    float wrapped = static_cast<float>(geodesy::wrap360(degrees));
    return wrapped >= 360.0f ? 0.0f : wrapped;
}

HeadingFilter::HeadingFilter(float smoothing_factor)
    : m_seeded(false),
      m_heading(0.0f),
      m_smoothing_factor(clampFactor(smoothing_factor))
{
    m_orientation.setZero();
}

std::optional<float> HeadingFilter::candidateHeading(const HeadingSample &sample)
{
    // All three device angles are required even when a platform heading is supplied
    if (!isUsable(sample.alpha) || !isUsable(sample.beta) || !isUsable(sample.gamma))
        return std::nullopt;

    if (isUsable(sample.compass_heading))
        return toCircle(*sample.compass_heading);

    // Yaw increases counter-clockwise, compass headings clockwise
    return toCircle(360.0 - *sample.alpha);
}

std::optional<float> HeadingFilter::ingest(const HeadingSample &sample)
{
    return ingest(sample, m_smoothing_factor);
}

std::optional<float> HeadingFilter::ingest(const HeadingSample &sample, float smoothing_factor)
{
    std::optional<float> candidate = candidateHeading(sample);
    if (!candidate)
        return std::nullopt;

    if (!m_seeded)
    {
        seed(*candidate, sample);
        return m_heading;
    }

    const float factor = clampFactor(smoothing_factor);
    const double diff = geodesy::shortestAngleDiff(*candidate, m_heading);
    m_heading = toCircle(m_heading + diff * factor + 360.0);

    updateOrientation(sample, factor);
    return m_heading;
}

std::optional<float> HeadingFilter::getHeading() const
{
    if (!m_seeded)
        return std::nullopt;
    return m_heading;
}

void HeadingFilter::setSmoothingFactor(float smoothing_factor)
{
    m_smoothing_factor = clampFactor(smoothing_factor);
}

void HeadingFilter::reset()
{
    m_seeded = false;
    m_heading = 0.0f;
    m_orientation.setZero();
}

void HeadingFilter::seed(float heading, const HeadingSample &sample)
{
    m_heading = heading;
    m_orientation.x() = toCircle(*sample.alpha);
    m_orientation.y() = static_cast<float>(geodesy::wrap180(*sample.beta));
    m_orientation.z() = *sample.gamma;
    m_seeded = true;
}

void HeadingFilter::updateOrientation(const HeadingSample &sample, float factor)
{
    // alpha and beta live on circles, gamma is bounded to +-90 and does not wrap
    const double d_alpha = geodesy::shortestAngleDiff(geodesy::wrap360(*sample.alpha), m_orientation.x());
    m_orientation.x() = toCircle(m_orientation.x() + d_alpha * factor);

    const double d_beta = geodesy::shortestAngleDiff(geodesy::wrap180(*sample.beta), m_orientation.y());
    m_orientation.y() = static_cast<float>(geodesy::wrap180(m_orientation.y() + d_beta * factor));

    m_orientation.z() += (*sample.gamma - m_orientation.z()) * factor;
}

float HeadingFilter::clampFactor(float factor)
{
    if (!std::isfinite(factor) || factor > 1.0f)
        return 1.0f;
    if (factor <= 0.0f)
        return 1e-3f;
    return factor;
}
