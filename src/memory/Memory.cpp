#include "Memory.hpp"
#include <algorithm>
#include <sstream>

const char* ToString(MemoryError error) {
    switch (error) {
        case MemoryError::None:            return "ok";
        case MemoryError::EmptyProgram:    return "CHIP-8 program is empty";
        case MemoryError::ProgramTooLarge: return "CHIP-8 program is too large";
        case MemoryError::Overflow:        return "operation would write beyond the end of RAM";
    }
    return "unknown memory error";
}

std::string ToString(MemoryError error, size_t program_size) {
    std::ostringstream out;
    out << ToString(error) << " (" << program_size << " bytes";
    if (error == MemoryError::ProgramTooLarge) {
        out << ", limit " << Memory::MAX_PROGRAM_SIZE;
    }
    out << ")";
    return out.str();
}

Memory::Memory() {
    ram.fill(0);
}

MemoryError Memory::Load(const uint8_t* bytes, size_t len, size_t offset) {
    if (offset > SIZE || len > SIZE - offset) {
        return MemoryError::Overflow;
    }
    std::copy(bytes, bytes + len, ram.begin() + offset);
    return MemoryError::None;
}

MemoryError Memory::Load(const std::vector<uint8_t>& bytes, size_t offset) {
    return Load(bytes.data(), bytes.size(), offset);
}

MemoryError Memory::Zero(size_t begin, size_t end) {
    if (begin > end || end > SIZE) {
        return MemoryError::Overflow;
    }
    std::fill(ram.begin() + begin, ram.begin() + end, 0);
    return MemoryError::None;
}

MemoryError Memory::ValidateProgram(size_t size) {
    if (size == 0) {
        return MemoryError::EmptyProgram;
    }
    if (size > MAX_PROGRAM_SIZE) {
        return MemoryError::ProgramTooLarge;
    }
    return MemoryError::None;
}

MemoryError Memory::LoadProgram(const std::vector<uint8_t>& program) {
    MemoryError error = ValidateProgram(program.size());
    if (error != MemoryError::None) {
        return error;
    }
    return Load(program, PROGRAM_START);
}

uint16_t Memory::ReadWord(size_t addr) const {
    return (static_cast<uint16_t>(ram[addr]) << 8) | ram[addr + 1];
}

void Memory::WriteWord(size_t addr, uint16_t value) {
    ram[addr] = value >> 8;
    ram[addr + 1] = value & 0xFF;
}
