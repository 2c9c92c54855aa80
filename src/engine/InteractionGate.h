/*
 * InteractionGate.h
 *
 * Purpose:
 *   Tracks whether the user is manipulating the globe and releases automatic rotation only after a
 *   quiet period (debounce) following the last interaction end.
 *
 * States / transitions:
 *   Idle   + start          -> Active
 *   Active + start          -> Active, pending release cancelled (re-entrant, e.g. multi-touch)
 *   Active + end            -> Active, release timer (re-)armed for debounceMs
 *   release fires           -> Idle, release handler called once with the fire instant
 *   Idle   + end            -> ignored
 *
 * Lifetime:
 *   - The release timer callback checks the owner's aliveness flag and no-ops after teardown.
 *   - shutdown() cancels any pending release.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "core/TimerQueue.h"

class Clock;

class InteractionGate {
public:
    using ReleaseHandler = std::function<void(std::int64_t nowMs)>;

    /*
     * Parameters:
     *   timers     : Queue that runs the debounce timer (drained by the frame loop).
     *   clock      : Time source for arming the timer and reporting the release instant.
     *   debounceMs : Quiet period after end() before returning to Idle.
     *   alive      : Owner's aliveness flag; deferred callbacks do nothing once *alive is false.
     */
    InteractionGate(TimerQueue& timers, const Clock& clock, std::int64_t debounceMs,
                    std::shared_ptr<const bool> alive);
    ~InteractionGate();

    InteractionGate(const InteractionGate&) = delete;
    InteractionGate& operator=(const InteractionGate&) = delete;

    void start();
    void end();

    // Consulted once per frame; never cache across frames.
    bool isActive() const { return m_active; }

    bool releasePending() const { return m_releaseTimer != 0; }
    std::int64_t debounceMs() const { return m_debounceMs; }

    void setReleaseHandler(ReleaseHandler handler) { m_onRelease = std::move(handler); }

    // Cancels the pending release timer. The gate keeps its current state.
    void shutdown();

private:
    TimerQueue& m_timers;
    const Clock& m_clock;
    std::int64_t m_debounceMs;
    std::shared_ptr<const bool> m_alive;

    bool m_active = false;
    TimerId m_releaseTimer = 0; // 0 => none pending
    ReleaseHandler m_onRelease;

    void cancelRelease();
    void release();
};
