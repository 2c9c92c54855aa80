/*
 * Clock.h
 *
 * Purpose:
 *   Declares the wall-clock time source used by every astronomical and scheduling computation.
 *   All instants are milliseconds since the Unix epoch (UTC).
 *
 * Implementations:
 *   - SystemClock: reads std::chrono::system_clock.
 *   - ManualClock: externally driven; used by tests and deterministic replays.
 */

#pragma once
#include <cstdint>

class Clock {
public:
    virtual ~Clock() = default;

    // Current instant in milliseconds since the Unix epoch.
    virtual std::int64_t nowMs() const = 0;
};

class SystemClock : public Clock {
public:
    std::int64_t nowMs() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(std::int64_t startMs = 0) : m_now(startMs) {}

    std::int64_t nowMs() const override { return m_now; }

    void set(std::int64_t ms) { m_now = ms; }
    void advance(std::int64_t ms) { m_now += ms; }

private:
    std::int64_t m_now;
};
