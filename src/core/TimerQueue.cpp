/*
 * TimerQueue.cpp
 *
 * Purpose:
 *   Implements the cooperative timer queue drained once per frame.
 */

#include "core/TimerQueue.h"
#include <algorithm>
#include <utility>
#include <vector>

TimerId TimerQueue::schedule(std::int64_t dueMs, Callback callback) {
    TimerId id = m_nextId++;
    m_timers.emplace(id, Entry{dueMs, std::move(callback)});
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    return m_timers.erase(id) != 0;
}

std::size_t TimerQueue::runDue(std::int64_t nowMs) {
    // Snapshot due ids first so timers scheduled by callbacks wait for the next pass.
    std::vector<std::pair<std::int64_t, TimerId>> due;
    for (const auto& kv : m_timers) {
        if (kv.second.dueMs <= nowMs) due.emplace_back(kv.second.dueMs, kv.first);
    }
    std::sort(due.begin(), due.end());

    std::size_t ran = 0;
    for (const auto& d : due) {
        auto it = m_timers.find(d.second);
        if (it == m_timers.end()) continue; // cancelled by an earlier callback

        Callback cb = std::move(it->second.callback);
        m_timers.erase(it);
        if (cb) {
            cb();
            ++ran;
        }
    }
    return ran;
}
