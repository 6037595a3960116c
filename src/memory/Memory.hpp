#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <type_traits>
#include <vector>

/**
 * MemoryError - Result of bulk memory operations
 *
 * None means the operation completed. Any other value means nothing
 * was written.
 */
enum class MemoryError {
    None,
    EmptyProgram,
    ProgramTooLarge,
    Overflow
};

const char* ToString(MemoryError error);

// Message naming the program size that was rejected
std::string ToString(MemoryError error, size_t program_size);

/**
 * MemoryRegion - Fixed-size window onto RAM
 *
 * The byte count is part of the type. Indexing is unchecked, like
 * Memory::Read.
 */
template <typename Byte, size_t N>
class MemoryRegion {
public:
    static constexpr size_t SIZE = N;

    explicit MemoryRegion(Byte* first) : first(first) {}
    MemoryRegion(std::array<std::remove_const_t<Byte>, N>& bytes) : first(bytes.data()) {}
    MemoryRegion(const std::array<std::remove_const_t<Byte>, N>& bytes) : first(bytes.data()) {}

    // Writable region to read-only region
    template <typename Other>
    MemoryRegion(const MemoryRegion<Other, N>& other) : first(other.data()) {}

    Byte& operator[](size_t index) const { return first[index]; }
    Byte* data() const { return first; }
    Byte* begin() const { return first; }
    Byte* end() const { return first + N; }
    static constexpr size_t size() { return N; }

private:
    Byte* first;
};

/**
 * Memory - COSMAC VIP RAM (4 KB)
 *
 * Hardware Behavior:
 * - One flat byte array, big-endian for 16-bit values
 * - Program data, interpreter registers and the display refresh page
 *   all live in the same address space
 * - Does NOT know which ranges are valid for which register, that is
 *   the interpreter's job
 *
 * Memory Map:
 * +-----------------------------------------+ 0x000
 * | Hex glyphs (80 bytes) + glyph table     |
 * | (reserved interpreter area, 512 bytes)  |
 * +-----------------------------------------+ 0x200
 * | User program (3232 bytes)               |
 * +-----------------------------------------+ 0xEA0
 * | Stack (48 bytes, 12 slots used)         |
 * +-----------------------------------------+ 0xED0
 * | Interpreter work area (48 bytes)        |
 * | 0xEF0 - 0xEFF contain V0-VF             |
 * +-----------------------------------------+ 0xF00
 * | Display refresh (256 bytes)             |
 * +-----------------------------------------+ 0x1000
 */
class Memory {
public:
    static constexpr size_t SIZE = 0x1000;

    // === Glyphs ===
    static constexpr uint16_t GLYPH_START       = 0x000;
    static constexpr uint16_t GLYPH_BYTES       = 5;
    static constexpr uint16_t GLYPH_COUNT       = 16;
    static constexpr uint16_t GLYPH_TABLE_START = GLYPH_START + GLYPH_BYTES * GLYPH_COUNT;

    // === Program ===
    static constexpr uint16_t PROGRAM_START = 0x200;
    static constexpr uint16_t STACK_START   = 0xEA0;
    static constexpr uint16_t PROGRAM_LAST  = STACK_START - 1;
    static constexpr size_t   MAX_PROGRAM_SIZE = PROGRAM_LAST - PROGRAM_START + 1;

    // === Stack ===
    static constexpr uint16_t STACK_SLOTS = 12;
    static constexpr uint16_t STACK_LIMIT = STACK_START + STACK_SLOTS * 2;

    // === Interpreter work area ===
    static constexpr uint16_t WORK_AREA_START        = 0xED0;
    static constexpr uint16_t PROGRAM_COUNTER_ADDR   = WORK_AREA_START;
    static constexpr uint16_t INDEX_ADDR             = WORK_AREA_START + 2;
    static constexpr uint16_t STACK_POINTER_ADDR     = WORK_AREA_START + 4;
    static constexpr uint16_t DELAY_TIMER_ADDR       = WORK_AREA_START + 6;
    static constexpr uint16_t TONE_TIMER_ADDR        = WORK_AREA_START + 7;
    static constexpr uint16_t KEY_STATUS_ADDR        = WORK_AREA_START + 8;
    static constexpr uint16_t KEY_WAIT_STATE_ADDR    = WORK_AREA_START + 10;
    static constexpr uint16_t KEY_WAIT_REGISTER_ADDR = WORK_AREA_START + 11;
    static constexpr uint16_t REGISTERS_START        = 0xEF0;
    static constexpr uint16_t REGISTER_COUNT         = 16;

    // === Display refresh ===
    static constexpr uint16_t DISPLAY_START = 0xF00;
    static constexpr uint16_t DISPLAY_SIZE  = 256;

    using RegisterFile = MemoryRegion<uint8_t, REGISTER_COUNT>;
    using ConstRegisterFile = MemoryRegion<const uint8_t, REGISTER_COUNT>;
    using DisplayPage = MemoryRegion<uint8_t, DISPLAY_SIZE>;
    using ConstDisplayPage = MemoryRegion<const uint8_t, DISPLAY_SIZE>;

    Memory();

    // Copy bytes to [offset, offset + len). Nothing is written on failure.
    MemoryError Load(const uint8_t* bytes, size_t len, size_t offset);
    MemoryError Load(const std::vector<uint8_t>& bytes, size_t offset);

    // Zero-fill [begin, end)
    MemoryError Zero(size_t begin, size_t end);

    // At least one byte, at most MAX_PROGRAM_SIZE
    static MemoryError ValidateProgram(size_t size);

    // Validates the size, then loads at PROGRAM_START
    MemoryError LoadProgram(const std::vector<uint8_t>& program);

    // === Raw access (callers validate addresses) ===
    uint8_t Read(size_t addr) const { return ram[addr]; }
    void Write(size_t addr, uint8_t value) { ram[addr] = value; }
    uint16_t ReadWord(size_t addr) const;
    void WriteWord(size_t addr, uint16_t value);

    // === Views ===
    RegisterFile Registers() { return RegisterFile(ram.data() + REGISTERS_START); }
    ConstRegisterFile Registers() const { return ConstRegisterFile(ram.data() + REGISTERS_START); }
    DisplayPage DisplayBuffer() { return DisplayPage(ram.data() + DISPLAY_START); }
    ConstDisplayPage DisplayBuffer() const { return ConstDisplayPage(ram.data() + DISPLAY_START); }

    const std::array<uint8_t, SIZE>& Bytes() const { return ram; }

private:
    std::array<uint8_t, SIZE> ram;
};
