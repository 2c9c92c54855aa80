/*
 * InteractionGate.cpp
 *
 * Purpose:
 *   Implements the debounced interaction state machine.
 */

#include "engine/InteractionGate.h"
#include "core/Clock.h"

#include <utility>

InteractionGate::InteractionGate(TimerQueue& timers, const Clock& clock, std::int64_t debounceMs,
                                 std::shared_ptr<const bool> alive)
    : m_timers(timers), m_clock(clock), m_debounceMs(debounceMs), m_alive(std::move(alive)) {}

InteractionGate::~InteractionGate() {
    cancelRelease();
}

void InteractionGate::start() {
    if (!m_alive || !*m_alive) return;
    m_active = true;
    cancelRelease();
}

void InteractionGate::end() {
    if (!m_alive || !*m_alive) return;
    if (!m_active) return;

    cancelRelease();

    // Cancelled by the destructor; the flag covers runs after engine teardown.
    std::shared_ptr<const bool> alive = m_alive;
    m_releaseTimer = m_timers.schedule(m_clock.nowMs() + m_debounceMs, [this, alive]() {
        if (!*alive) return;
        release();
    });
}

void InteractionGate::shutdown() {
    cancelRelease();
}

void InteractionGate::cancelRelease() {
    if (m_releaseTimer != 0) {
        m_timers.cancel(m_releaseTimer);
        m_releaseTimer = 0;
    }
}

void InteractionGate::release() {
    m_releaseTimer = 0;
    if (!m_active) return;

    m_active = false;
    if (m_onRelease) m_onRelease(m_clock.nowMs());
}
