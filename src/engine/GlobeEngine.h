/*
 * GlobeEngine.h
 *
 * Purpose:
 *   Wires the globe's control components around one GlobeView:
 *     - InteractionGate   (controls start/end -> active/idle with debounce)
 *     - RotationScheduler (per-frame camera sync + idle rotation)
 *     - ViewportAdapter   (resize -> projection)
 *   and hands out a GlobeController for later recenter requests.
 *
 * Lifetime:
 *   - The engine owns one aliveness flag shared (weakly or via aliasing) with every deferred
 *     callback it creates: the gate's debounce timer, resize notifications and controller calls.
 *   - shutdown() (also run by the destructor) flips the flag, cancels the debounce timer and
 *     removes the control listeners. Anything arriving afterwards is a no-op.
 *
 * Threading:
 *   - Main thread only. Controls callbacks, timers and tick() interleave but never overlap.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "core/Config.h"
#include "core/Controls.h"
#include "core/Location.h"
#include "engine/InteractionGate.h"
#include "engine/RotationScheduler.h"
#include "engine/ViewportAdapter.h"
#include "scene/ViewState.h"

class Clock;
class GlobeView;
class TimerQueue;

// State shared between the engine and the controller handles it gives out.
struct GlobeEngineState {
    bool alive = true;
    GlobeView* view = nullptr;
    std::optional<Marker> marker;
    int recenterMs = 1000;
    double recenterAltitude = 2.0;
};

/*
 * Handle returned by GlobeEngine::start().
 *
 * Notes:
 *   - Cheap to copy. Every call is a no-op (returning false) once the engine is gone or shut down.
 *   - The location must already be validated (see ParseLocation).
 */
class GlobeController {
public:
    GlobeController() = default;

    // Replaces the marker and starts an animated recenter on the location.
    bool showLocation(const Location& location);

    bool clearMarker();

    std::optional<Marker> marker() const;

    bool valid() const;

private:
    friend class GlobeEngine;
    explicit GlobeController(std::weak_ptr<GlobeEngineState> state) : m_state(std::move(state)) {}

    std::weak_ptr<GlobeEngineState> m_state;
};

class GlobeEngine {
public:
    GlobeEngine(GlobeView& view, const Clock& clock, TimerQueue& timers, const GlobeConfig& config);
    ~GlobeEngine();

    GlobeEngine(const GlobeEngine&) = delete;
    GlobeEngine& operator=(const GlobeEngine&) = delete;

    /*
     * Subscribes to the controls (may be null: no interaction) and applies the configured
     * control flags to them.
     *
     * Returns:
     *   Controller handle for marker/recenter requests.
     */
    GlobeController start(Controls* controls);

    // One frame: pending viewport size, camera sync, idle rotation.
    TickResult tick();

    // Surface size notification (framebuffer callback). Returns true if the projection changed.
    bool notifyResize(int width, int height);

    void shutdown();
    bool running() const { return m_state->alive; }

    const InteractionGate& gate() const { return m_gate; }
    const RotationScheduler& scheduler() const { return m_scheduler; }
    const ViewportAdapter& viewport() const { return m_viewport; }

private:
    GlobeView& m_view;
    const Clock& m_clock;
    GlobeConfig m_config;

    std::shared_ptr<GlobeEngineState> m_state;

    InteractionGate m_gate;
    RotationScheduler m_scheduler;
    ViewportAdapter m_viewport;

    Controls* m_controls = nullptr;
    std::vector<ListenerId> m_listeners;

    void onControlsEnd();
    void onControlsChange(const ViewDelta& d);
};
