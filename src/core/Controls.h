/*
 * Controls.h
 *
 * Purpose:
 *   Declares the globe's interaction controls (orbit-controls style), independent of the windowing
 *   library. Input.cpp feeds GLFW events into it; the engine subscribes to its events.
 *
 * Events:
 *   - start  : a gesture began (first button down, or a wheel step while no button is down).
 *   - change : the gesture produced a view delta.
 *   - end    : the gesture finished (last button up, or right after a standalone wheel step).
 *   A wheel step during a drag only emits change; the drag's own end closes the gesture.
 *
 * Gesture mapping:
 *   - Primary button drag  : rotate (enableRotate). Horizontal -> longitude, vertical -> latitude.
 *   - Secondary button drag: pan (enablePan). The globe is pinned to the origin, so a pan drag
 *     slides the view like a rotation but at half rate.
 *   - Wheel                : zoom (enableZoom) by scaling altitude.
 *   - A disabled gesture emits nothing, so it never pauses auto-rotation.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

struct ViewDelta {
    double dLatitude = 0.0;
    double dLongitude = 0.0;
    double altitudeScale = 1.0; // multiplicative
};

enum class PointerButton {
    Primary,
    Secondary
};

using ListenerId = std::uint64_t;

class Controls {
public:
    using Listener = std::function<void()>;
    using ChangeListener = std::function<void(const ViewDelta&)>;

    bool enableZoom = true;
    bool enablePan = false;
    bool enableRotate = true;

    // Degrees per pixel at altitude 1.0; scaled by the current altitude via altitudeHint.
    double rotateDegreesPerPixel = 0.25;
    double zoomStep = 0.1;

    // Current altitude as last reported by the view; scales drag sensitivity.
    double altitudeHint = 1.0;

    ListenerId addStartListener(Listener l);
    ListenerId addEndListener(Listener l);
    ListenerId addChangeListener(ChangeListener l);
    bool removeListener(ListenerId id);
    std::size_t listenerCount() const;

    void pointerDown(PointerButton button, double x, double y);
    void pointerMove(double x, double y);
    void pointerUp(PointerButton button);
    void wheel(double scrollY);

    bool dragging() const { return m_activeButtons != 0; }

private:
    std::map<ListenerId, Listener> m_start;
    std::map<ListenerId, Listener> m_end;
    std::map<ListenerId, ChangeListener> m_change;
    ListenerId m_nextId = 1;

    int m_activeButtons = 0; // bitmask: 1 = primary, 2 = secondary
    double m_lastX = 0.0;
    double m_lastY = 0.0;

    static int Bit(PointerButton b) { return b == PointerButton::Primary ? 1 : 2; }
    bool gestureEnabled(PointerButton b) const;

    void emitStart();
    void emitEnd();
    void emitChange(const ViewDelta& d);
};
