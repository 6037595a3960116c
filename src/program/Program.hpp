#pragma once

#include <cstdint>
#include <vector>
#include <string>

#include "../memory/Memory.hpp"

/**
 * Program - Raw CHIP-8 program bytes
 *
 * There is no header, the file is loaded as-is at $200. Only the size
 * is validated (Memory::ValidateProgram): at least one byte, at most the
 * 3232 bytes between $200 and the stack.
 */
class Program {
public:
    Program();

    // Load from file. Returns false if the file cannot be read or the
    // size is invalid (GetLastError() says which).
    bool LoadFile(const std::string& path);

    // Load from bytes already in memory
    MemoryError LoadBytes(const std::string& program_name, const std::vector<uint8_t>& bytes);

    const std::vector<uint8_t>& Bytes() const { return data; }
    const std::string& GetName() const { return name; }
    size_t GetSize() const { return data.size(); }
    bool IsLoaded() const { return loaded; }
    MemoryError GetLastError() const { return last_error; }
    // Size of the byte sequence behind GetLastError(), 0 when there is none
    size_t GetRejectedSize() const { return rejected_size; }

    // Name, size and up to the first 10 bytes
    std::string GetInfo() const;

private:
    std::string name;
    std::vector<uint8_t> data;
    bool loaded;
    MemoryError last_error;
    size_t rejected_size;
};
