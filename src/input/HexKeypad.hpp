#pragma once

#include <cstdint>
#include <optional>

class Memory;

/**
 * HexKeypad - COSMAC VIP 16-key hex keypad state
 *
 * Hardware Behavior:
 * - One key can be reported as depressed at a time
 * - The status word lives in the interpreter work area:
 *   0x0000 = no key, 0x01KK = key KK depressed
 * - Does NOT know about the host keyboard, the frontend feeds it
 *
 * Wait State Machine (FX0A):
 * - WAIT_IDLE: no wait pending
 * - WAIT_FOR_PRESS: waiting for any key to go down
 * - WAIT_FOR_RELEASE: a key was seen, VX tracks it until it is released
 */
class HexKeypad {
public:
    static constexpr uint8_t KEY_COUNT = 16;
    static constexpr uint16_t STATUS_NONE = 0x0000;
    static constexpr uint16_t STATUS_PRESSED = 0x0100;

    enum WaitState : uint8_t {
        WAIT_IDLE        = 0,
        WAIT_FOR_PRESS   = 1,
        WAIT_FOR_RELEASE = 2
    };

    // === Key Status (directly exposed to the frontend) ===
    // Keys above 0xF are reported as no key
    static void SetCurrentKey(Memory& memory, std::optional<uint8_t> key);
    static std::optional<uint8_t> GetCurrentKey(const Memory& memory);

    // === Wait State Machine ===
    static void BeginWait(Memory& memory, uint8_t dest_register);
    static WaitState GetWaitState(const Memory& memory);
    static bool IsWaiting(const Memory& memory) { return GetWaitState(memory) != WAIT_IDLE; }

    // Advance one step. Returns true once the key has been released and
    // the wait instruction is complete.
    static bool AdvanceWait(Memory& memory);
};
