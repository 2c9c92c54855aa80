/*
 * RotationScheduler.h
 *
 * Purpose:
 *   Per-frame driver of the globe. Each tick:
 *     1) delta = now - lastFrame; lastFrame = now
 *     2) if the view/camera is not ready: skip (the loop keeps running; nothing throws)
 *     3) camera tilt <- declination(now)           (always, also while interacting)
 *     4) if the gate is idle, no recenter transition is running and delta > 0:
 *          longitude <- normalize(longitude + rate * delta), applied with zero transition
 *
 * Notes:
 *   - The gate is read fresh every tick; its debounce timer may have fired just before this tick.
 *   - resetBaseline() is called when the gate releases so the idle time is not applied as a jump.
 */

#pragma once

#include <cstdint>

#include "environment/SolarPosition.h"
#include "engine/CameraSynchronizer.h"

class GlobeView;
class InteractionGate;

enum class TickResult {
    Skipped,    // view or camera not ready
    CameraOnly, // camera re-synchronized, no rotation (interacting, transitioning or delta <= 0)
    Rotated     // camera re-synchronized and longitude advanced
};

class RotationScheduler {
public:
    /*
     * Parameters:
     *   view          : Rendering boundary to read/write the point of view and camera.
     *   gate          : Interaction gate consulted each tick.
     *   degreesPerMs  : Rotation rate (sign selects direction).
     *   startMs       : Initial frame-time baseline.
     */
    RotationScheduler(GlobeView& view, const InteractionGate& gate, double degreesPerMs, std::int64_t startMs);

    TickResult tick(std::int64_t nowMs);

    void resetBaseline(std::int64_t nowMs) { m_lastFrameMs = nowMs; }
    std::int64_t lastFrameMs() const { return m_lastFrameMs; }

    double degreesPerMs() const { return m_degreesPerMs; }

    const CameraSynchronizer& synchronizer() const { return m_sync; }
    CameraSynchronizer& synchronizer() { return m_sync; }

private:
    GlobeView& m_view;
    const InteractionGate& m_gate;
    double m_degreesPerMs;
    std::int64_t m_lastFrameMs;

    SolarPositionModel m_solar;
    CameraSynchronizer m_sync;
};
