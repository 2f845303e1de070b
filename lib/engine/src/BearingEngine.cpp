#include "BearingEngine.h"
#include "Geodesy.h"
#include "Readout.h"

#include <cmath>
#include <iostream>

BearingEngine::BearingEngine(const EngineConfig &config, Logger *logger)
    : m_config(config.sanitized()),
      m_logger(logger),
      m_heading_filter(m_config.heading_smoothing),
      m_projector(m_config.projectorConfig()),
      m_projection(),
      m_generation(0),
      m_status(Status::AWAITING_TARGET),
      m_delivered_generation(0)
{
}

BearingEngine::BearingEngine(const GeoPoint &target, const EngineConfig &config, Logger *logger)
    : BearingEngine(config, logger)
{
    setTarget(target);
}

bool BearingEngine::setTarget(const GeoPoint &target)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_target)
    {
        std::cerr << "[BearingEngine] Target already set, ignoring new target." << std::endl;
        return false;
    }
    if (!geodesy::isValid(target))
    {
        std::cerr << "[BearingEngine] Rejected invalid target " << target.latitude << ", " << target.longitude << std::endl;
        return false;
    }

    GeoPoint accepted = target;
    if (!std::isfinite(accepted.altitude))
        accepted.altitude = 0.0;
    m_target = accepted;

    std::cout << "[BearingEngine] Target " << accepted.latitude << ", " << accepted.longitude
              << " alt " << accepted.altitude << " m" << std::endl;
    transitionTo(Status::AWAITING_INPUTS);

    // Inputs may have arrived before the target
    if (!recompute(now(0)))
        return true;

    Projection projection = m_projection;
    uint64_t generation = m_generation;
    ProjectionListener listener = m_listener;
    lock.unlock();

    notify(listener, projection, generation);
    return true;
}

bool BearingEngine::onPositionFix(const GeoPoint &point, uint64_t timestamp)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!geodesy::isValid(point))
        return false;

    GeoPoint fix = point;
    // Fixes without altitude arrive as NaN, treat them as sea level
    if (!std::isfinite(fix.altitude))
        fix.altitude = 0.0;
    m_observer = fix;

    if (!recompute(now(timestamp)))
        return true;

    Projection projection = m_projection;
    uint64_t generation = m_generation;
    ProjectionListener listener = m_listener;
    lock.unlock();

    notify(listener, projection, generation);
    return true;
}

bool BearingEngine::onOrientationSample(const HeadingSample &sample)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_heading_filter.ingest(sample))
        return false;

    if (!recompute(now(sample.timestamp)))
        return true;

    Projection projection = m_projection;
    uint64_t generation = m_generation;
    ProjectionListener listener = m_listener;
    lock.unlock();

    notify(listener, projection, generation);
    return true;
}

Projection BearingEngine::currentProjection() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_projection;
}

DisplayReadout BearingEngine::readout() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const float heading = m_heading_filter.getHeading().value_or(0.0f);
    return makeReadout(m_projection, heading, m_config.compass_pixels_per_degree);
}

std::optional<float> BearingEngine::currentHeading() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_heading_filter.getHeading();
}

Eigen::Vector3f BearingEngine::orientation() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_heading_filter.orientation();
}

std::optional<GeoPoint> BearingEngine::observer() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_observer;
}

std::optional<GeoPoint> BearingEngine::target() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_target;
}

BearingEngine::Status BearingEngine::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

void BearingEngine::setProjectionListener(ProjectionListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void BearingEngine::setTimeSource(TimeSource time_source)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_time_source = std::move(time_source);
}

void BearingEngine::reinitialize()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_observer.reset();
    m_heading_filter.reset();
    m_projector.reset();
    m_projection = Projection();
    transitionTo(m_target ? Status::AWAITING_INPUTS : Status::AWAITING_TARGET);
}

const char *BearingEngine::statusName(Status status)
{
    switch (status)
    {
    case Status::AWAITING_TARGET:
        return "AWAITING_TARGET";
    case Status::AWAITING_INPUTS:
        return "AWAITING_INPUTS";
    case Status::TRACKING:
        return "TRACKING";
    case Status::AT_TARGET:
        return "AT_TARGET";
    }
    return "UNKNOWN";
}

bool BearingEngine::recompute(uint64_t timestamp)
{
    std::optional<float> heading = m_heading_filter.getHeading();
    if (!m_target || !m_observer || !heading)
        return false;

    const bool projected = m_projector.project(*m_observer, *m_target, *heading);
    transitionTo(m_projector.isDegenerate() ? Status::AT_TARGET : Status::TRACKING);
    if (!projected)
        return false;

    m_projection.timestamp = timestamp;
    m_projection.available = true;
    m_projection.bearing = m_projector.result();
    m_projection.direction = m_projector.direction();
    m_generation++;

    logState(timestamp);
    return true;
}

void BearingEngine::notify(const ProjectionListener &listener, const Projection &projection, uint64_t generation)
{
    if (!listener)
        return;

    // Writers race to get here, a newer projection may already be out
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    if (generation <= m_delivered_generation)
        return;
    m_delivered_generation = generation;
    listener(projection);
}

void BearingEngine::transitionTo(Status status)
{
    if (status == m_status)
        return;
    std::cout << "[BearingEngine] Exiting " << statusName(m_status) << " state." << std::endl;
    m_status = status;
    std::cout << "[BearingEngine] Entering " << statusName(m_status) << " state." << std::endl;
}

uint64_t BearingEngine::now(uint64_t fallback) const
{
    if (m_time_source)
        return m_time_source();
    return fallback;
}

void BearingEngine::logState(uint64_t timestamp)
{
    if (m_logger == nullptr)
        return;

    const BearingResult &bearing = m_projection.bearing;
    m_logger->log("heading", Eigen::Matrix<float, 1, 1>::Constant(m_heading_filter.getHeading().value_or(0.0f)), timestamp);
    m_logger->log("orientation", m_heading_filter.orientation(), timestamp);
    m_logger->log("bearing", Eigen::Vector4d(bearing.relative_bearing_deg, bearing.elevation_rad,
                                             bearing.horizontal_distance_m, bearing.total_distance_m), timestamp);
    m_logger->log("direction", m_projection.direction, timestamp);
}
