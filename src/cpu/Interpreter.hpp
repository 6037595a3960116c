#pragma once

#include <cstdint>
#include <array>
#include <optional>
#include <ostream>

#include "../memory/Memory.hpp"
#include "../timer/Timer.hpp"
#include "Fault.hpp"

class Clock;
class RandomSource;

/**
 * InterpreterState - Diagnostic snapshot of everything the program can see
 *
 * Copied out of memory, changing it has no effect on the interpreter.
 */
struct InterpreterState {
    uint16_t program_counter;
    uint16_t instruction;
    uint16_t index;
    uint16_t stack_pointer;
    uint8_t delay_timer;
    uint8_t tone_timer;
    uint16_t key_status;
    std::array<uint8_t, Memory::REGISTER_COUNT> registers;
    std::array<uint8_t, Memory::DISPLAY_SIZE> display;
};

std::ostream& operator<<(std::ostream& out, const InterpreterState& state);

/**
 * Interpreter - CHIP-8 Instruction Engine
 *
 * Behavior:
 * - All CHIP-8 registers (PC, I, SP, timers, key status, V0-VF) and the
 *   display live in Memory at fixed addresses, like the COSMAC VIP
 *   interpreter kept them in its work area
 * - The only state held here is the random source and the two timer
 *   expiry marks
 * - Does NOT pace itself, the caller decides how often Step() runs
 *
 * Interface:
 * - Reset() once after loading a program, then Step() repeatedly
 * - Key state and tone state are polled by the caller between steps
 */
class Interpreter {
public:
    static constexpr uint16_t INSTRUCTION_SIZE = 2;
    static constexpr uint8_t DISPLAY_WIDTH = 64;
    static constexpr uint8_t DISPLAY_HEIGHT = 32;
    static constexpr uint8_t DISPLAY_ROW_BYTES = DISPLAY_WIDTH / 8;
    static constexpr uint8_t TONE_THRESHOLD = 2;  // VIP speaker ignores 1 jiffy

    Interpreter(RandomSource& rng, const Clock& clock);

    // Clear stack, work area and display, load glyphs, PC = $200
    void Reset(Memory& memory);

    // Execute one instruction (or one key-wait transition). Throws Fault.
    void Step(Memory& memory);

    // === Peripheral Interface (polled between steps) ===
    static bool IsToneSounding(const Memory& memory);
    static void SetCurrentKeyPress(Memory& memory, std::optional<uint8_t> key);
    static InterpreterState GetState(const Memory& memory);

    // === Register Access (for instruction implementations) ===
    static uint16_t GetProgramCounter(const Memory& memory) { return memory.ReadWord(Memory::PROGRAM_COUNTER_ADDR); }
    static uint16_t GetIndex(const Memory& memory) { return memory.ReadWord(Memory::INDEX_ADDR); }
    static uint16_t GetStackPointer(const Memory& memory) { return memory.ReadWord(Memory::STACK_POINTER_ADDR); }
    static void SetIndex(Memory& memory, uint16_t value);
    void SetDelayTimer(Memory& memory, uint8_t jiffies);
    void SetToneTimer(Memory& memory, uint8_t jiffies);
    uint8_t NextRandomByte();

    // Subroutine stack. Push takes the caller's own address.
    static void PushReturnAddress(Memory& memory, uint16_t address);
    static uint16_t PopReturnAddress(Memory& memory);

    // Fault for the instruction at the current program counter
    static Fault MakeFault(const Memory& memory, FaultKind kind);

private:
    RandomSource& rng;
    const Clock& clock;

    CountdownTimer delay_timer;
    CountdownTimer tone_timer;

    void UpdateTimers(Memory& memory);
    static void CommitProgramCounter(Memory& memory, uint16_t next);
};
