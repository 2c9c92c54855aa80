/*
 * TimerQueue.h
 *
 * Purpose:
 *   Declares a single-threaded deferred-callback queue (setTimeout/clearTimeout style).
 *   Timers are drained by the frame loop via runDue(now), so callbacks interleave with frame ticks
 *   on the same thread and never run concurrently with them.
 *
 * Ordering:
 *   - Due callbacks run in (dueMs, id) order.
 *   - A callback may cancel timers that are also due in the same pass; cancelled timers do not run.
 *   - Timers scheduled from inside a callback run on a later runDue() call at the earliest.
 */

#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <map>

using TimerId = std::uint64_t;

class TimerQueue {
public:
    using Callback = std::function<void()>;

    /*
     * Schedules a callback.
     *
     * Parameters:
     *   dueMs    : Instant (ms since epoch) at or after which the callback runs.
     *   callback : Work to run. Must not be empty.
     *
     * Returns:
     *   Non-zero id usable with cancel().
     */
    TimerId schedule(std::int64_t dueMs, Callback callback);

    // Removes a pending timer. Returns false if it already ran or was never scheduled.
    bool cancel(TimerId id);

    /*
     * Runs every timer whose due instant is <= nowMs.
     *
     * Returns:
     *   Number of callbacks executed.
     */
    std::size_t runDue(std::int64_t nowMs);

    std::size_t pending() const { return m_timers.size(); }
    bool isPending(TimerId id) const { return m_timers.count(id) != 0; }

    // Drops every pending timer without running it.
    void clear() { m_timers.clear(); }

private:
    struct Entry {
        std::int64_t dueMs;
        Callback callback;
    };

    std::map<TimerId, Entry> m_timers;
    TimerId m_nextId = 1;
};
