#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "Peripherals.hpp"
#include "cpu/Interpreter.hpp"
#include "memory/Memory.hpp"

class Clock;
class RandomSource;
class Program;

/**
 * Emulator - The COSMAC VIP "Motherboard"
 *
 * Wiring Model:
 * - Owns the RAM, the interpreter and its two ambient sources
 *   (wall clock, random bytes)
 * - Tick() is one pass of the pacing loop: execute an instruction, then
 *   refresh the screen, the tone and the key state
 * - Does NOT pace itself, main decides how many ticks run per second
 */
class Emulator {
public:
    Emulator();
    Emulator(std::unique_ptr<RandomSource> rng, std::unique_ptr<Clock> clock);
    ~Emulator();

    // === Initialization (like powering on the VIP) ===
    MemoryError LoadProgram(const Program& program);
    void Reset();

    // === Execution ===
    void Step();
    void Tick(Screen& screen, Tone& tone, HexKeyboard& keyboard);

    // === Peripheral Signals ===
    Memory::ConstDisplayPage GetDisplayBuffer() const { return memory->DisplayBuffer(); }
    bool IsToneSounding() const;
    void SetKey(std::optional<uint8_t> key);

    // === Debug Access ===
    InterpreterState GetState() const;
    const Memory& GetMemory() const { return *memory; }
    uint64_t GetTotalSteps() const { return total_steps; }

private:
    std::unique_ptr<RandomSource> rng;
    std::unique_ptr<Clock> clock;
    std::unique_ptr<Memory> memory;
    std::unique_ptr<Interpreter> interpreter;

    uint64_t total_steps;
};
