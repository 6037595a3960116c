#include "HexKeypad.hpp"
#include "../memory/Memory.hpp"

void HexKeypad::SetCurrentKey(Memory& memory, std::optional<uint8_t> key) {
    if (key && *key < KEY_COUNT) {
        memory.WriteWord(Memory::KEY_STATUS_ADDR, STATUS_PRESSED | *key);
    } else {
        memory.WriteWord(Memory::KEY_STATUS_ADDR, STATUS_NONE);
    }
}

std::optional<uint8_t> HexKeypad::GetCurrentKey(const Memory& memory) {
    uint16_t status = memory.ReadWord(Memory::KEY_STATUS_ADDR);
    if (!(status & STATUS_PRESSED)) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(status & 0x0F);
}

void HexKeypad::BeginWait(Memory& memory, uint8_t dest_register) {
    memory.Write(Memory::KEY_WAIT_STATE_ADDR, WAIT_FOR_PRESS);
    memory.Write(Memory::KEY_WAIT_REGISTER_ADDR, dest_register & 0x0F);
}

HexKeypad::WaitState HexKeypad::GetWaitState(const Memory& memory) {
    return static_cast<WaitState>(memory.Read(Memory::KEY_WAIT_STATE_ADDR));
}

bool HexKeypad::AdvanceWait(Memory& memory) {
    WaitState state = GetWaitState(memory);
    if (state == WAIT_IDLE) return false;

    std::optional<uint8_t> key = GetCurrentKey(memory);
    uint8_t dest = memory.Read(Memory::KEY_WAIT_REGISTER_ADDR);

    if (key) {
        // Keep VX live for as long as the key is held
        memory.Registers()[dest] = *key;
        memory.Write(Memory::KEY_WAIT_STATE_ADDR, WAIT_FOR_RELEASE);
        return false;
    }

    if (state == WAIT_FOR_RELEASE) {
        memory.Write(Memory::KEY_WAIT_STATE_ADDR, WAIT_IDLE);
        memory.Write(Memory::KEY_WAIT_REGISTER_ADDR, 0);
        return true;
    }

    return false;
}
