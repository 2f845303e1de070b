#pragma once

#include "GeoTypes.h"
#include <Eigen/Dense>
#include <optional>

/**
 * @class HeadingFilter
 * @brief Smooths compass heading samples into a stable heading estimate.
 *
 * Each new sample moves the estimate along the short arc of the circle by
 * a fraction of the angular error, so a 359 -> 2 degree transition is a
 * 3 degree step rather than a sweep through 180. The raw device angles
 * (alpha, beta, gamma) are smoothed alongside the heading.
 */
class HeadingFilter
{
public:
    explicit HeadingFilter(float smoothing_factor = 1.0f);

    // Returns the new heading, or nothing if the sample was rejected
    std::optional<float> ingest(const HeadingSample &sample);
    std::optional<float> ingest(const HeadingSample &sample, float smoothing_factor);

    // Heading implied by a single sample, before any smoothing
    static std::optional<float> candidateHeading(const HeadingSample &sample);

    bool isSeeded() const { return m_seeded; }
    std::optional<float> getHeading() const;

    // Smoothed {alpha, beta, gamma} in degrees. Zero until seeded.
    const Eigen::Vector3f &orientation() const { return m_orientation; }

    void setSmoothingFactor(float smoothing_factor);
    float getSmoothingFactor() const { return m_smoothing_factor; }

    void reset();

private:
    // --- Filter State ---
    bool m_seeded;
    float m_heading;              // [0, 360)
    Eigen::Vector3f m_orientation; // alpha [0,360), beta (-180,180], gamma

    // --- Tuning ---
    float m_smoothing_factor; // (0, 1], 1 = pass-through

    void seed(float heading, const HeadingSample &sample);
    void updateOrientation(const HeadingSample &sample, float factor);
    static float clampFactor(float factor);
};
