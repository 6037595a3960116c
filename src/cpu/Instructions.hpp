#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../memory/Memory.hpp"

/**
 * CHIP-8 Instruction Definitions
 *
 * Encoding:
 * - High nibble selects the family
 * - X = bits 8-11, Y = bits 4-7, N = bits 0-3, NN = bits 0-7, NNN = bits 0-11
 * - Families 8, E and F are further split on N or NN
 *
 * Every handler returns the next program counter. The default is the
 * instruction's own address + 2, skips return + 4.
 *
 * The table is mutually exclusive: at most one entry matches any 16-bit
 * value. 0NNN (machine language subroutine) is deliberately absent and
 * falls through to the unknown-instruction path.
 */

class Interpreter;

using InstructionHandler = uint16_t (*)(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

struct InstructionPattern {
    uint16_t mask;
    uint16_t pattern;
    const char* mnemonic;       // {x} {y} {n} {nn} {nnn} are substituted
    InstructionHandler execute;

    bool Matches(uint16_t op) const { return (op & mask) == pattern; }
};

// Ordered decode table
const std::vector<InstructionPattern>& InstructionTable();

// Matching entry, or nullptr
const InstructionPattern* DecodeInstruction(uint16_t op);

// e.g. "SE V3, $2A" (or "???? $XXXX" when nothing matches)
std::string Disassemble(uint16_t op);

// === Instruction Categories ===

// Flow control
uint16_t CLS(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t RET(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t JP_nnn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t CALL_nnn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t JP_V0_nnn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// Skips
uint16_t SE_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SNE_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SE_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SNE_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SKP_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SKNP_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// Register set and ALU
uint16_t LD_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t RND_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t ADD_Vx_nn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t OR_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t AND_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t XOR_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t ADD_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SUB_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SHR_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SUBN_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t SHL_Vx_Vy(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// Timers and keypad
uint16_t LD_Vx_DT(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_Vx_K(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_DT_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_ST_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// Index register
uint16_t LD_I_nnn(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t ADD_I_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_F_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_B_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_I_Vx(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);
uint16_t LD_Vx_I(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// Display
uint16_t DRW_Vx_Vy_n(Interpreter& cpu, Memory& memory, uint16_t op, uint16_t pc);

// XOR an N-row sprite onto the display at (x, y). Returns true on collision.
bool DrawSprite(Memory::DisplayPage display, const uint8_t* sprite, uint8_t rows, uint8_t x, uint8_t y);
