#pragma once

#include <cstdint>
#include "Memory.hpp"

/**
 * Glyphs - Hex digit patterns (0-F)
 *
 * Each glyph is 5 rows of 4 pixels in the high nibble. The glyphs are
 * followed by a table of 16 big-endian glyph addresses so the
 * interpreter can look a digit up the same way the COSMAC VIP interpreter
 * did, through memory.
 */

// Write glyph patterns and the address table into the reserved area
MemoryError LoadGlyphs(Memory& memory);

// Address of the 5-byte glyph for the low nibble of digit
uint16_t GlyphAddress(const Memory& memory, uint8_t digit);
