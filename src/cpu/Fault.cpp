#include "Fault.hpp"
#include <sstream>
#include <iomanip>

const char* ToString(FaultKind kind) {
    switch (kind) {
        case FaultKind::UnknownInstruction:       return "unknown instruction";
        case FaultKind::NativeSubroutine:         return "machine language subroutines are not supported";
        case FaultKind::ProgramCounterOutOfRange: return "program counter left the program area";
        case FaultKind::IndexOutOfRange:          return "I left the addressable range";
        case FaultKind::StackUnderflow:           return "return with an empty stack";
        case FaultKind::StackOverflow:            return "more than 12 nested subroutines";
    }
    return "unknown fault";
}

static std::string FormatFault(FaultKind kind, uint16_t instruction, uint16_t address) {
    std::ostringstream out;
    out << ToString(kind) << " (instruction $" << std::hex << std::uppercase
        << std::setfill('0') << std::setw(4) << instruction
        << " at $" << std::setw(4) << address << ")";
    return out.str();
}

Fault::Fault(FaultKind kind, uint16_t instruction, uint16_t address)
    : std::runtime_error(FormatFault(kind, instruction, address))
    , kind(kind)
    , instruction(instruction)
    , address(address)
{
}
