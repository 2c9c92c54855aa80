/*
 * Controls.cpp
 *
 * Purpose:
 *   Implements gesture -> event translation for the globe controls.
 *
 * Notes:
 *   - Listener maps are copied before dispatch so a listener may remove itself (or others) safely.
 *   - start/end are balanced: a drag with several buttons, or with wheel steps in between, is one
 *     gesture that ends when the last button is released.
 *   - Dragging right moves the view westward (the surface follows the cursor); dragging down moves
 *     it north.
 */

#include "core/Controls.h"

#include <utility>
#include <vector>

ListenerId Controls::addStartListener(Listener l) {
    ListenerId id = m_nextId++;
    m_start.emplace(id, std::move(l));
    return id;
}

ListenerId Controls::addEndListener(Listener l) {
    ListenerId id = m_nextId++;
    m_end.emplace(id, std::move(l));
    return id;
}

ListenerId Controls::addChangeListener(ChangeListener l) {
    ListenerId id = m_nextId++;
    m_change.emplace(id, std::move(l));
    return id;
}

bool Controls::removeListener(ListenerId id) {
    return (m_start.erase(id) + m_end.erase(id) + m_change.erase(id)) != 0;
}

std::size_t Controls::listenerCount() const {
    return m_start.size() + m_end.size() + m_change.size();
}

bool Controls::gestureEnabled(PointerButton b) const {
    return (b == PointerButton::Primary) ? enableRotate : enablePan;
}

void Controls::pointerDown(PointerButton button, double x, double y) {
    if (!gestureEnabled(button)) return;

    bool wasDragging = dragging();
    m_activeButtons |= Bit(button);
    m_lastX = x;
    m_lastY = y;

    // One gesture spans from the first button down to the last button up.
    if (!wasDragging) emitStart();
}

void Controls::pointerMove(double x, double y) {
    if (!dragging()) return;

    double dx = x - m_lastX;
    double dy = y - m_lastY;
    m_lastX = x;
    m_lastY = y;
    if (dx == 0.0 && dy == 0.0) return;

    double rate = rotateDegreesPerPixel * (altitudeHint > 0.0 ? altitudeHint : 1.0);
    if (!(m_activeButtons & Bit(PointerButton::Primary))) rate *= 0.5; // pan only

    ViewDelta d;
    d.dLongitude = -dx * rate;
    d.dLatitude = dy * rate;
    emitChange(d);
}

void Controls::pointerUp(PointerButton button) {
    int bit = Bit(button);
    if (!(m_activeButtons & bit)) return;

    m_activeButtons &= ~bit;
    if (!dragging()) emitEnd();
}

void Controls::wheel(double scrollY) {
    if (!enableZoom || scrollY == 0.0) return;

    // Mid-drag the wheel step joins the running gesture; otherwise it is a gesture of its own.
    bool standalone = !dragging();
    if (standalone) emitStart();

    ViewDelta d;
    // Scroll up (positive) zooms in: lower altitude.
    d.altitudeScale = (scrollY > 0.0) ? 1.0 / (1.0 + zoomStep * scrollY) : (1.0 - zoomStep * scrollY);
    emitChange(d);

    if (standalone) emitEnd();
}

void Controls::emitStart() {
    std::vector<Listener> ls;
    for (const auto& kv : m_start) ls.push_back(kv.second);
    for (auto& l : ls) if (l) l();
}

void Controls::emitEnd() {
    std::vector<Listener> ls;
    for (const auto& kv : m_end) ls.push_back(kv.second);
    for (auto& l : ls) if (l) l();
}

void Controls::emitChange(const ViewDelta& d) {
    std::vector<ChangeListener> ls;
    for (const auto& kv : m_change) ls.push_back(kv.second);
    for (auto& l : ls) if (l) l(d);
}
