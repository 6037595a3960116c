#include "Glyphs.hpp"
#include <array>

static const std::array<uint8_t, Memory::GLYPH_BYTES * Memory::GLYPH_COUNT> GLYPH_DATA = {
    0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
    0x20, 0x60, 0x20, 0x20, 0x70, // 1
    0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
    0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
    0x90, 0x90, 0xF0, 0x10, 0x10, // 4
    0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
    0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
    0xF0, 0x10, 0x20, 0x40, 0x40, // 7
    0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
    0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
    0xF0, 0x90, 0xF0, 0x90, 0x90, // A
    0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
    0xF0, 0x80, 0x80, 0x80, 0xF0, // C
    0xE0, 0x90, 0x90, 0x90, 0xE0, // D
    0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
    0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

MemoryError LoadGlyphs(Memory& memory) {
    MemoryError result = memory.Load(GLYPH_DATA.data(), GLYPH_DATA.size(), Memory::GLYPH_START);
    if (result != MemoryError::None) {
        return result;
    }

    std::array<uint8_t, Memory::GLYPH_COUNT * 2> table;
    for (uint16_t digit = 0; digit < Memory::GLYPH_COUNT; digit++) {
        uint16_t addr = Memory::GLYPH_START + digit * Memory::GLYPH_BYTES;
        table[digit * 2] = addr >> 8;
        table[digit * 2 + 1] = addr & 0xFF;
    }
    return memory.Load(table.data(), table.size(), Memory::GLYPH_TABLE_START);
}

uint16_t GlyphAddress(const Memory& memory, uint8_t digit) {
    return memory.ReadWord(Memory::GLYPH_TABLE_START + (digit & 0x0F) * 2);
}
