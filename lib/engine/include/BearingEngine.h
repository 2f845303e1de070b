#pragma once

#include "BearingProjector.h"
#include "EngineConfig.h"
#include "GeoTypes.h"
#include "HeadingFilter.h"
#include "Logger.h"
#include "ProjectionTypes.h"

#include <functional>
#include <mutex>
#include <optional>

using TimeSource = std::function<uint64_t()>;
using ProjectionListener = std::function<void(const Projection &)>;

/**
 * @class BearingEngine
 * @brief Points a moving, rotating observer at a fixed geographic target.
 *
 * Position fixes and orientation samples may arrive in any order and at any
 * rate. Every accepted input recomputes the projection from the latest value
 * of each; the result is cached for currentProjection() and handed to the
 * listener, if one is set. Bad input is dropped and the previous state kept.
 *
 * All calls are synchronous and may come from several threads. State is
 * guarded by one mutex; the listener runs after it is released. Listener
 * calls are serialised and never go backwards: a projection older than the
 * last one delivered is dropped. The listener may read from the engine but
 * must not feed it new inputs.
 */
class BearingEngine
{
public:
    enum class Status
    {
        AWAITING_TARGET,
        AWAITING_INPUTS, // target set, still missing a fix or a heading
        TRACKING,
        AT_TARGET        // observer on top of the target, bearing held
    };

    explicit BearingEngine(const EngineConfig &config = EngineConfig(), Logger *logger = nullptr);
    BearingEngine(const GeoPoint &target, const EngineConfig &config = EngineConfig(), Logger *logger = nullptr);

    BearingEngine(const BearingEngine &) = delete;
    BearingEngine &operator=(const BearingEngine &) = delete;

    // --- Host call surface ---
    bool setTarget(const GeoPoint &target);
    bool onPositionFix(const GeoPoint &point, uint64_t timestamp = 0);
    bool onOrientationSample(const HeadingSample &sample);
    Projection currentProjection() const;

    // --- Extras ---
    DisplayReadout readout() const;
    std::optional<float> currentHeading() const;
    Eigen::Vector3f orientation() const;
    std::optional<GeoPoint> observer() const;
    std::optional<GeoPoint> target() const;
    Status status() const;
    const EngineConfig &getConfig() const { return m_config; }

    void setProjectionListener(ProjectionListener listener);
    void setTimeSource(TimeSource time_source);

    // Forget observer, heading and placement. The target is kept.
    void reinitialize();

    static const char *statusName(Status status);

private:
    // Caller holds m_mutex
    bool recompute(uint64_t timestamp);
    void transitionTo(Status status);
    uint64_t now(uint64_t fallback) const;
    void logState(uint64_t timestamp);

    // Caller does not hold m_mutex
    void notify(const ProjectionListener &listener, const Projection &projection, uint64_t generation);

    const EngineConfig m_config;
    Logger *m_logger;

    mutable std::mutex m_mutex;
    std::optional<GeoPoint> m_target;
    std::optional<GeoPoint> m_observer;
    HeadingFilter m_heading_filter;
    BearingProjector m_projector;
    Projection m_projection;
    uint64_t m_generation; // bumped on every new projection
    Status m_status;

    ProjectionListener m_listener;
    TimeSource m_time_source;

    std::mutex m_listener_mutex;
    uint64_t m_delivered_generation;
};
