#pragma once

#include <cstdint>
#include <optional>
#include "Clock.hpp"

class Memory;

/**
 * CountdownTimer - 60 Hz delay/tone timer driven by wall-clock time
 *
 * Behavior:
 * - The visible register is one byte in the interpreter work area
 * - Setting N jiffies records an expiry instant now + N * 1000/60 ms
 *   (whole milliseconds) and writes N to the register
 * - Update() recomputes the register from the time remaining, so the
 *   count stays correct however often the interpreter is stepped
 * - Does NOT decrement per step
 */
class CountdownTimer {
public:
    static constexpr uint32_t JIFFIES_PER_SECOND = 60;

    explicit CountdownTimer(uint16_t register_addr);

    void Reset() { expiry.reset(); }

    void Set(Memory& memory, uint8_t jiffies, Clock::TimePoint now);
    void Update(Memory& memory, Clock::TimePoint now);

    bool IsRunning() const { return expiry.has_value(); }
    std::optional<Clock::TimePoint> GetExpiry() const { return expiry; }

private:
    uint16_t register_addr;
    std::optional<Clock::TimePoint> expiry;
};
