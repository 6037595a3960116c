#pragma once

#include <cstdint>
#include <optional>

#include "memory/Memory.hpp"

/**
 * Peripherals - What the pacing loop talks to
 *
 * Three independent capabilities. The interpreter never calls them,
 * Emulator::Tick does, between steps.
 */

class Tone {
public:
    virtual ~Tone() = default;
    virtual void StartTone() = 0;
    virtual void StopTone() = 0;
    virtual bool IsToneOn() const = 0;
};

class Screen {
public:
    virtual ~Screen() = default;
    // 32 rows of 8 bytes, MSB = leftmost pixel, 1 = lit
    virtual void DrawBuffer(Memory::ConstDisplayPage display) = 0;
};

class HexKeyboard {
public:
    virtual ~HexKeyboard() = default;
    virtual std::optional<uint8_t> GetCurrentPressedKey() const = 0;
};
