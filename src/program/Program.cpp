#include "Program.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <iomanip>
#include <filesystem>

static constexpr size_t INFO_PREVIEW_BYTES = 10;

Program::Program()
    : loaded(false)
    , last_error(MemoryError::None)
    , rejected_size(0)
{
}

bool Program::LoadFile(const std::string& path) {
    last_error = MemoryError::None;
    rejected_size = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return false;
    }

    return LoadBytes(std::filesystem::path(path).stem().string(), bytes) == MemoryError::None;
}

MemoryError Program::LoadBytes(const std::string& program_name, const std::vector<uint8_t>& bytes) {
    last_error = Memory::ValidateProgram(bytes.size());
    if (last_error != MemoryError::None) {
        rejected_size = bytes.size();
        loaded = false;
        return last_error;
    }

    rejected_size = 0;
    name = program_name;
    data = bytes;
    loaded = true;
    return MemoryError::None;
}

std::string Program::GetInfo() const {
    std::ostringstream info;
    info << "=== CHIP-8 Program ===\n";
    info << "Name: " << name << "\n";
    info << "Size: " << data.size() << " bytes ("
         << Memory::MAX_PROGRAM_SIZE - data.size() << " free)\n";
    info << "Head:";
    info << std::hex << std::uppercase << std::setfill('0');
    for (size_t i = 0; i < data.size() && i < INFO_PREVIEW_BYTES; i++) {
        info << " " << std::setw(2) << static_cast<int>(data[i]);
    }
    info << "\n";
    return info.str();
}
