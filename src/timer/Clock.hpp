#pragma once

#include <chrono>

/**
 * Clock - Wall-clock source for the countdown timers
 *
 * The interpreter only ever asks for "now". Tests substitute a clock
 * that advances by hand.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SteadyClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::steady_clock::now(); }
};
