/*
 * Clock.cpp
 *
 * Purpose:
 *   Implements SystemClock on top of std::chrono::system_clock.
 */

#include "core/Clock.h"
#include <chrono>

std::int64_t SystemClock::nowMs() const {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
