#pragma once

#include <cstdint>
#include <stdexcept>

enum class FaultKind {
    UnknownInstruction,
    NativeSubroutine,           // 0NNN, needs the CDP1802 machine-code layer
    ProgramCounterOutOfRange,
    IndexOutOfRange,
    StackUnderflow,
    StackOverflow
};

const char* ToString(FaultKind kind);

/**
 * Fault - Unrecoverable interpreter condition
 *
 * Thrown from Interpreter::Step. The program counter is not committed
 * for the faulting instruction.
 */
class Fault : public std::runtime_error {
public:
    Fault(FaultKind kind, uint16_t instruction, uint16_t address);

    FaultKind GetKind() const { return kind; }
    uint16_t GetInstruction() const { return instruction; }
    uint16_t GetAddress() const { return address; }

private:
    FaultKind kind;
    uint16_t instruction;
    uint16_t address;
};
