/*
 * GlobeEngine.cpp
 *
 * Purpose:
 *   Implements engine wiring, teardown and the controller handle.
 */

#include "engine/GlobeEngine.h"
#include "engine/GlobeView.h"
#include "core/Clock.h"
#include "core/TimerQueue.h"

#include <algorithm>
#include <iostream>

// ---------------- GlobeController ----------------

bool GlobeController::valid() const {
    auto s = m_state.lock();
    return s && s->alive && s->view;
}

bool GlobeController::showLocation(const Location& location) {
    auto s = m_state.lock();
    if (!s || !s->alive || !s->view) return false;

    Marker m;
    m.latitude = ClampLatitude(location.latitude);
    m.longitude = NormalizeLongitude(location.longitude);
    m.label = location.label;

    s->marker = m;
    s->view->setMarker(s->marker);

    ViewState pose;
    pose.latitude = m.latitude;
    pose.longitude = m.longitude;
    pose.altitude = s->recenterAltitude;
    s->view->pointOfView(pose, s->recenterMs);
    return true;
}

bool GlobeController::clearMarker() {
    auto s = m_state.lock();
    if (!s || !s->alive || !s->view) return false;

    s->marker.reset();
    s->view->setMarker(std::nullopt);
    return true;
}

std::optional<Marker> GlobeController::marker() const {
    auto s = m_state.lock();
    if (!s || !s->alive) return std::nullopt;
    return s->marker;
}

// ---------------- GlobeEngine ----------------

GlobeEngine::GlobeEngine(GlobeView& view, const Clock& clock, TimerQueue& timers, const GlobeConfig& config)
    : m_view(view),
      m_clock(clock),
      m_config(config),
      m_state(std::make_shared<GlobeEngineState>()),
      m_gate(timers, clock, config.interaction.debounceMs,
             std::shared_ptr<const bool>(m_state, &m_state->alive)),
      m_scheduler(view, m_gate, config.rotation.degreesPerMs, clock.nowMs()),
      m_viewport(config.viewport.marginFactor, config.viewport.cameraDistance) {
    m_state->view = &view;
    m_state->recenterMs = config.recenter.transitionMs;
    m_state->recenterAltitude = config.recenter.altitude;

    // Idle time spent under the debounce must not turn into a rotation jump.
    m_gate.setReleaseHandler([this](std::int64_t nowMs) { m_scheduler.resetBaseline(nowMs); });
}

GlobeEngine::~GlobeEngine() {
    shutdown();
}

GlobeController GlobeEngine::start(Controls* controls) {
    if (!m_state->alive) return GlobeController();

    if (controls && !m_controls) {
        m_controls = controls;
        controls->enableZoom = m_config.controls.enableZoom;
        controls->enablePan = m_config.controls.enablePan;
        controls->enableRotate = m_config.controls.enableRotate;
        controls->rotateDegreesPerPixel = m_config.controls.rotateDegreesPerPixel;
        controls->zoomStep = m_config.controls.zoomStep;
        controls->altitudeHint = m_view.pointOfView().altitude;

        m_listeners.push_back(controls->addStartListener([this]() { m_gate.start(); }));
        m_listeners.push_back(controls->addEndListener([this]() { onControlsEnd(); }));
        m_listeners.push_back(controls->addChangeListener([this](const ViewDelta& d) { onControlsChange(d); }));
    }

    return GlobeController(m_state);
}

/*
 * Runs one frame of engine work.
 *
 * Returns:
 *   Skipped after shutdown or while the view is not ready; otherwise the scheduler's result.
 */
TickResult GlobeEngine::tick() {
    if (!m_state->alive) return TickResult::Skipped;

    if (m_viewport.hasPending()) m_viewport.applyPending(m_view);
    return m_scheduler.tick(m_clock.nowMs());
}

bool GlobeEngine::notifyResize(int width, int height) {
    if (!m_state->alive) return false;
    return m_viewport.onResize(m_view, width, height);
}

void GlobeEngine::shutdown() {
    if (!m_state->alive) return;

    m_state->alive = false;
    m_gate.shutdown();

    if (m_controls) {
        for (ListenerId id : m_listeners) m_controls->removeListener(id);
        m_listeners.clear();
        m_controls = nullptr;
    }
}

void GlobeEngine::onControlsEnd() {
    if (!m_state->alive) return;
    m_gate.end();

    ViewState pov = m_view.pointOfView();
    std::cerr << "[Controls] view lng=" << pov.longitude << " lat=" << pov.latitude
              << " alt=" << pov.altitude << "\n";
}

/*
 * Applies a gesture delta to the current point of view.
 *
 * Behavior:
 *   - Latitude is clamped to [-90, 90], longitude normalized, altitude scaled and clamped to
 *     [controls.minAltitude, controls.maxAltitude].
 *   - Applied with zero transition, which also cancels a running recenter.
 *   - Ignored until the view is ready.
 */
void GlobeEngine::onControlsChange(const ViewDelta& d) {
    if (!m_state->alive || !m_view.ready()) return;

    ViewState pov = m_view.pointOfView();
    pov.latitude = ClampLatitude(pov.latitude + d.dLatitude);
    pov.longitude = NormalizeLongitude(pov.longitude + d.dLongitude);
    pov.altitude = std::clamp(pov.altitude * d.altitudeScale,
                              m_config.controls.minAltitude, m_config.controls.maxAltitude);

    // Direct manipulation wins over a running recenter.
    m_view.pointOfView(pov, 0);

    if (m_controls) m_controls->altitudeHint = pov.altitude;
}
