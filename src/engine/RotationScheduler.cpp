/*
 * RotationScheduler.cpp
 *
 * Purpose:
 *   Implements the per-frame camera sync and idle auto-rotation.
 */

#include "engine/RotationScheduler.h"
#include "engine/GlobeView.h"
#include "engine/InteractionGate.h"

RotationScheduler::RotationScheduler(GlobeView& view, const InteractionGate& gate,
                                     double degreesPerMs, std::int64_t startMs)
    : m_view(view), m_gate(gate), m_degreesPerMs(degreesPerMs), m_lastFrameMs(startMs) {}

/*
 * Parameters:
 *   nowMs : Frame instant. The baseline moves to it even when the tick is skipped, so a long
 *           loading phase does not turn into one large rotation step.
 *
 * Returns:
 *   Skipped, CameraOnly or Rotated (see TickResult).
 */
TickResult RotationScheduler::tick(std::int64_t nowMs) {
    std::int64_t delta = nowMs - m_lastFrameMs;
    m_lastFrameMs = nowMs;

    // Assets may still be loading; retry next frame.
    if (!m_view.ready()) return TickResult::Skipped;
    Camera* cam = m_view.camera();
    if (!cam) return TickResult::Skipped;

    m_sync.apply(*cam, m_solar.declinationAt(nowMs));

    if (m_gate.isActive() || m_view.transitionActive() || delta <= 0) {
        return TickResult::CameraOnly;
    }

    ViewState pov = m_view.pointOfView();
    pov.longitude = NormalizeLongitude(pov.longitude + m_degreesPerMs * static_cast<double>(delta));
    m_view.pointOfView(pov, 0);
    return TickResult::Rotated;
}
