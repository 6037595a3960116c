/**
 * CHIP-8 Instruction Implementation
 *
 * Key Principles:
 * 1. All registers live in Memory, the handlers mutate them in place
 * 2. 8-bit arithmetic wraps
 * 3. VF is written after the result, so a flag always wins over VF as
 *    a destination
 * 4. Subtraction sets VF = 1 when there was NO borrow
 */

#include "Instructions.hpp"
#include "Interpreter.hpp"
#include "../memory/Glyphs.hpp"
#include "../input/HexKeypad.hpp"
#include <algorithm>
#include <cstdio>

// === Helper: operand fields ===
static uint8_t X(uint16_t op) { return (op >> 8) & 0x0F; }
static uint8_t Y(uint16_t op) { return (op >> 4) & 0x0F; }
static uint8_t N(uint16_t op) { return op & 0x000F; }
static uint8_t NN(uint16_t op) { return op & 0x00FF; }
static uint16_t NNN(uint16_t op) { return op & 0x0FFF; }

static uint16_t Next(uint16_t pc) { return pc + Interpreter::INSTRUCTION_SIZE; }
static uint16_t Skip(uint16_t pc) { return pc + 2 * Interpreter::INSTRUCTION_SIZE; }

static constexpr uint8_t VF = 0xF;

// =============================================================================
// DECODE TABLE
// =============================================================================

const std::vector<InstructionPattern>& InstructionTable() {
    static const std::vector<InstructionPattern> table = {
        { 0xFFFF, 0x00E0, "CLS",                  CLS },
        { 0xFFFF, 0x00EE, "RET",                  RET },
        { 0xF000, 0x1000, "JP ${nnn}",            JP_nnn },
        { 0xF000, 0x2000, "CALL ${nnn}",          CALL_nnn },
        { 0xF000, 0x3000, "SE V{x}, ${nn}",       SE_Vx_nn },
        { 0xF000, 0x4000, "SNE V{x}, ${nn}",      SNE_Vx_nn },
        { 0xF00F, 0x5000, "SE V{x}, V{y}",        SE_Vx_Vy },
        { 0xF000, 0x6000, "LD V{x}, ${nn}",       LD_Vx_nn },
        { 0xF000, 0x7000, "ADD V{x}, ${nn}",      ADD_Vx_nn },
        { 0xF00F, 0x8000, "LD V{x}, V{y}",        LD_Vx_Vy },
        { 0xF00F, 0x8001, "OR V{x}, V{y}",        OR_Vx_Vy },
        { 0xF00F, 0x8002, "AND V{x}, V{y}",       AND_Vx_Vy },
        { 0xF00F, 0x8003, "XOR V{x}, V{y}",       XOR_Vx_Vy },
        { 0xF00F, 0x8004, "ADD V{x}, V{y}",       ADD_Vx_Vy },
        { 0xF00F, 0x8005, "SUB V{x}, V{y}",       SUB_Vx_Vy },
        { 0xF00F, 0x8006, "SHR V{x}, V{y}",       SHR_Vx_Vy },
        { 0xF00F, 0x8007, "SUBN V{x}, V{y}",      SUBN_Vx_Vy },
        { 0xF00F, 0x800E, "SHL V{x}, V{y}",       SHL_Vx_Vy },
        { 0xF00F, 0x9000, "SNE V{x}, V{y}",       SNE_Vx_Vy },
        { 0xF000, 0xA000, "LD I, ${nnn}",         LD_I_nnn },
        { 0xF000, 0xB000, "JP V0, ${nnn}",        JP_V0_nnn },
        { 0xF000, 0xC000, "RND V{x}, ${nn}",      RND_Vx_nn },
        { 0xF000, 0xD000, "DRW V{x}, V{y}, {n}",  DRW_Vx_Vy_n },
        { 0xF0FF, 0xE09E, "SKP V{x}",             SKP_Vx },
        { 0xF0FF, 0xE0A1, "SKNP V{x}",            SKNP_Vx },
        { 0xF0FF, 0xF007, "LD V{x}, DT",          LD_Vx_DT },
        { 0xF0FF, 0xF00A, "LD V{x}, K",           LD_Vx_K },
        { 0xF0FF, 0xF015, "LD DT, V{x}",          LD_DT_Vx },
        { 0xF0FF, 0xF018, "LD ST, V{x}",          LD_ST_Vx },
        { 0xF0FF, 0xF01E, "ADD I, V{x}",          ADD_I_Vx },
        { 0xF0FF, 0xF029, "LD F, V{x}",           LD_F_Vx },
        { 0xF0FF, 0xF033, "LD B, V{x}",           LD_B_Vx },
        { 0xF0FF, 0xF055, "LD [I], V{x}",         LD_I_Vx },
        { 0xF0FF, 0xF065, "LD V{x}, [I]",         LD_Vx_I },
    };
    return table;
}

const InstructionPattern* DecodeInstruction(uint16_t op) {
    for (const InstructionPattern& entry : InstructionTable()) {
        if (entry.Matches(op)) {
            return &entry;
        }
    }
    return nullptr;
}

std::string Disassemble(uint16_t op) {
    char buffer[8];
    const InstructionPattern* entry = DecodeInstruction(op);
    if (!entry) {
        std::snprintf(buffer, sizeof(buffer), "$%04X", op);
        return (op & 0xF000) == 0 ? std::string("SYS ") + buffer : std::string("???? ") + buffer;
    }

    std::string text = entry->mnemonic;
    auto substitute = [&text, &buffer](const char* field, const char* format, unsigned value) {
        size_t pos = text.find(field);
        if (pos == std::string::npos) return;
        std::snprintf(buffer, sizeof(buffer), format, value);
        text.replace(pos, std::char_traits<char>::length(field), buffer);
    };
    substitute("{nnn}", "%03X", NNN(op));
    substitute("{nn}", "%02X", NN(op));
    substitute("{n}", "%X", N(op));
    substitute("{x}", "%X", X(op));
    substitute("{y}", "%X", Y(op));
    return text;
}

// =============================================================================
// FLOW CONTROL
// =============================================================================

// 00E0 - clear display
uint16_t CLS(Interpreter&, Memory& memory, uint16_t, uint16_t pc) {
    Memory::DisplayPage display = memory.DisplayBuffer();
    std::fill(display.begin(), display.end(), 0);
    return Next(pc);
}

// 00EE - return to the instruction after the call
uint16_t RET(Interpreter&, Memory& memory, uint16_t, uint16_t) {
    return Next(Interpreter::PopReturnAddress(memory));
}

// 1NNN
uint16_t JP_nnn(Interpreter&, Memory&, uint16_t op, uint16_t) {
    return NNN(op);
}

// 2NNN - the call's own address is pushed, RET adds 2
uint16_t CALL_nnn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Interpreter::PushReturnAddress(memory, pc);
    return NNN(op);
}

// BNNN
uint16_t JP_V0_nnn(Interpreter&, Memory& memory, uint16_t op, uint16_t) {
    return NNN(op) + memory.Registers()[0];
}

// =============================================================================
// SKIPS
// =============================================================================

// 3XNN
uint16_t SE_Vx_nn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    return memory.Registers()[X(op)] == NN(op) ? Skip(pc) : Next(pc);
}

// 4XNN
uint16_t SNE_Vx_nn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    return memory.Registers()[X(op)] != NN(op) ? Skip(pc) : Next(pc);
}

// 5XY0
uint16_t SE_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::ConstRegisterFile v = memory.Registers();
    return v[X(op)] == v[Y(op)] ? Skip(pc) : Next(pc);
}

// 9XY0
uint16_t SNE_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::ConstRegisterFile v = memory.Registers();
    return v[X(op)] != v[Y(op)] ? Skip(pc) : Next(pc);
}

// EX9E - skip if the key matching the low nibble of VX is down
uint16_t SKP_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    std::optional<uint8_t> key = HexKeypad::GetCurrentKey(memory);
    uint8_t wanted = memory.Registers()[X(op)] & 0x0F;
    return (key && *key == wanted) ? Skip(pc) : Next(pc);
}

// EXA1
uint16_t SKNP_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    std::optional<uint8_t> key = HexKeypad::GetCurrentKey(memory);
    uint8_t wanted = memory.Registers()[X(op)] & 0x0F;
    return (!key || *key != wanted) ? Skip(pc) : Next(pc);
}

// =============================================================================
// REGISTER SET AND ALU
// =============================================================================

// 6XNN
uint16_t LD_Vx_nn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    memory.Registers()[X(op)] = NN(op);
    return Next(pc);
}

// CXNN
uint16_t RND_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc) {
    memory.Registers()[X(op)] = cpu.NextRandomByte() & NN(op);
    return Next(pc);
}

// 7XNN - no carry flag
uint16_t ADD_Vx_nn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    v[X(op)] = static_cast<uint8_t>(v[X(op)] + NN(op));
    return Next(pc);
}

// 8XY0
uint16_t LD_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    v[X(op)] = v[Y(op)];
    return Next(pc);
}

// 8XY1
uint16_t OR_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    v[X(op)] |= v[Y(op)];
    return Next(pc);
}

// 8XY2
uint16_t AND_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    v[X(op)] &= v[Y(op)];
    return Next(pc);
}

// 8XY3 (undocumented)
uint16_t XOR_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    v[X(op)] ^= v[Y(op)];
    return Next(pc);
}

// 8XY4 - VF = carry
uint16_t ADD_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint16_t sum = v[X(op)] + v[Y(op)];
    v[X(op)] = sum & 0xFF;
    v[VF] = sum > 0xFF ? 1 : 0;
    return Next(pc);
}

// 8XY5 - VX = VX - VY, VF = 1 when no borrow
uint16_t SUB_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint8_t vx = v[X(op)];
    uint8_t vy = v[Y(op)];
    v[X(op)] = static_cast<uint8_t>(vx - vy);
    v[VF] = vx >= vy ? 1 : 0;
    return Next(pc);
}

// 8XY6 (undocumented) - VX = VY >> 1, VF = bit shifted out
uint16_t SHR_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint8_t vy = v[Y(op)];
    v[X(op)] = vy >> 1;
    v[VF] = vy & 0x01;
    return Next(pc);
}

// 8XY7 (undocumented) - VX = VY - VX, VF = 1 when no borrow
uint16_t SUBN_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint8_t vx = v[X(op)];
    uint8_t vy = v[Y(op)];
    v[X(op)] = static_cast<uint8_t>(vy - vx);
    v[VF] = vy >= vx ? 1 : 0;
    return Next(pc);
}

// 8XYE (undocumented) - VX = VY << 1, VF = bit shifted out
uint16_t SHL_Vx_Vy(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint8_t vy = v[Y(op)];
    v[X(op)] = static_cast<uint8_t>(vy << 1);
    v[VF] = (vy >> 7) & 0x01;
    return Next(pc);
}

// =============================================================================
// TIMERS AND KEYPAD
// =============================================================================

// FX07
uint16_t LD_Vx_DT(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    memory.Registers()[X(op)] = memory.Read(Memory::DELAY_TIMER_ADDR);
    return Next(pc);
}

// FX0A - PC stays put, Step() drives the wait from here on
uint16_t LD_Vx_K(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    HexKeypad::BeginWait(memory, X(op));
    return pc;
}

// FX15
uint16_t LD_DT_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc) {
    cpu.SetDelayTimer(memory, memory.Registers()[X(op)]);
    return Next(pc);
}

// FX18
uint16_t LD_ST_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc) {
    cpu.SetToneTimer(memory, memory.Registers()[X(op)]);
    return Next(pc);
}

// =============================================================================
// INDEX REGISTER
// =============================================================================

// ANNN
uint16_t LD_I_nnn(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Interpreter::SetIndex(memory, NNN(op));
    return Next(pc);
}

// FX1E
uint16_t ADD_I_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    uint16_t index = Interpreter::GetIndex(memory) + memory.Registers()[X(op)];
    Interpreter::SetIndex(memory, index);
    return Next(pc);
}

// FX29 - I = glyph for the low nibble of VX
uint16_t LD_F_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Interpreter::SetIndex(memory, GlyphAddress(memory, memory.Registers()[X(op)]));
    return Next(pc);
}

// FX33 - hundreds, tens, ones at I..I+2, I unchanged
uint16_t LD_B_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    uint8_t value = memory.Registers()[X(op)];
    uint16_t index = Interpreter::GetIndex(memory);
    memory.Write(index, value / 100);
    memory.Write(index + 1, (value / 10) % 10);
    memory.Write(index + 2, value % 10);
    return Next(pc);
}

// FX55 - store V0..VX at I, I += X + 1
uint16_t LD_I_Vx(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    uint16_t index = Interpreter::GetIndex(memory);
    Memory::ConstRegisterFile v = memory.Registers();
    for (uint8_t i = 0; i <= X(op); i++) {
        memory.Write(index + i, v[i]);
    }
    Interpreter::SetIndex(memory, index + X(op) + 1);
    return Next(pc);
}

// FX65 - load V0..VX from I, I += X + 1
uint16_t LD_Vx_I(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    uint16_t index = Interpreter::GetIndex(memory);
    Memory::RegisterFile v = memory.Registers();
    for (uint8_t i = 0; i <= X(op); i++) {
        v[i] = memory.Read(index + i);
    }
    Interpreter::SetIndex(memory, index + X(op) + 1);
    return Next(pc);
}

// =============================================================================
// DISPLAY
// =============================================================================

bool DrawSprite(Memory::DisplayPage display, const uint8_t* sprite, uint8_t rows, uint8_t x, uint8_t y) {
    // Sprites do not wrap
    if (x >= Interpreter::DISPLAY_WIDTH || y >= Interpreter::DISPLAY_HEIGHT) {
        return false;
    }

    uint8_t column = x / 8;
    uint8_t shift = x % 8;
    bool collision = false;

    for (uint8_t row = 0; row < rows; row++) {
        uint16_t line = y + row;
        if (line >= Interpreter::DISPLAY_HEIGHT) break;

        uint8_t* target = display.data() + line * Interpreter::DISPLAY_ROW_BYTES + column;

        uint8_t left = sprite[row] >> shift;
        collision |= (left & target[0]) != 0;
        target[0] ^= left;

        // Unaligned sprites spill into the next byte unless clipped
        if (shift != 0 && column + 1 < Interpreter::DISPLAY_ROW_BYTES) {
            uint8_t right = static_cast<uint8_t>(sprite[row] << (8 - shift));
            collision |= (right & target[1]) != 0;
            target[1] ^= right;
        }
    }

    return collision;
}

// DXYN
uint16_t DRW_Vx_Vy_n(Interpreter&, Memory& memory, uint16_t op, uint16_t pc) {
    Memory::RegisterFile v = memory.Registers();
    uint16_t index = Interpreter::GetIndex(memory);

    // Copy the rows out first so a sprite stored in the display page
    // reads its own pre-draw contents
    uint8_t sprite[15];
    for (uint8_t row = 0; row < N(op); row++) {
        sprite[row] = memory.Read(index + row);
    }

    bool collision = DrawSprite(memory.DisplayBuffer(), sprite, N(op), v[X(op)], v[Y(op)]);
    v[VF] = collision ? 1 : 0;
    return Next(pc);
}
