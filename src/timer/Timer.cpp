#include "Timer.hpp"
#include "../memory/Memory.hpp"

CountdownTimer::CountdownTimer(uint16_t register_addr)
    : register_addr(register_addr)
{
}

void CountdownTimer::Set(Memory& memory, uint8_t jiffies, Clock::TimePoint now) {
    memory.Write(register_addr, jiffies);
    if (jiffies == 0) {
        expiry.reset();
        return;
    }
    auto duration_ms = std::chrono::milliseconds(jiffies * 1000 / JIFFIES_PER_SECOND);
    expiry = now + duration_ms;
}

void CountdownTimer::Update(Memory& memory, Clock::TimePoint now) {
    if (!expiry) return;

    if (now >= *expiry) {
        memory.Write(register_addr, 0);
        expiry.reset();
        return;
    }

    auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(*expiry - now).count();
    memory.Write(register_addr, static_cast<uint8_t>(remaining_ms * JIFFIES_PER_SECOND / 1000));
}
