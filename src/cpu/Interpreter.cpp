#include "Interpreter.hpp"
#include "Instructions.hpp"
#include "Random.hpp"
#include "../memory/Glyphs.hpp"
#include "../input/HexKeypad.hpp"
#include <algorithm>
#include <iomanip>
#include <stdexcept>

Interpreter::Interpreter(RandomSource& rng, const Clock& clock)
    : rng(rng)
    , clock(clock)
    , delay_timer(Memory::DELAY_TIMER_ADDR)
    , tone_timer(Memory::TONE_TIMER_ADDR)
{
}

void Interpreter::Reset(Memory& memory) {
    // Stack, work area and display refresh run to the end of RAM
    if (memory.Zero(Memory::STACK_START, Memory::SIZE) != MemoryError::None ||
        LoadGlyphs(memory) != MemoryError::None) {
        throw std::logic_error("interpreter memory layout does not fit in RAM");
    }

    memory.WriteWord(Memory::PROGRAM_COUNTER_ADDR, Memory::PROGRAM_START);
    memory.WriteWord(Memory::STACK_POINTER_ADDR, Memory::STACK_START);

    delay_timer.Reset();
    tone_timer.Reset();
}

void Interpreter::Step(Memory& memory) {
    uint16_t pc = GetProgramCounter(memory);
    uint16_t instruction = memory.ReadWord(pc);

    UpdateTimers(memory);

    // FX0A stays at PC until the key is released
    if (HexKeypad::IsWaiting(memory)) {
        if (HexKeypad::AdvanceWait(memory)) {
            CommitProgramCounter(memory, pc + INSTRUCTION_SIZE);
        }
        return;
    }

    const InstructionPattern* entry = DecodeInstruction(instruction);
    if (!entry) {
        FaultKind kind = (instruction & 0xF000) == 0x0000
            ? FaultKind::NativeSubroutine
            : FaultKind::UnknownInstruction;
        throw Fault(kind, instruction, pc);
    }

    uint16_t next = entry->execute(*this, memory, instruction, pc);
    CommitProgramCounter(memory, next);
}

void Interpreter::UpdateTimers(Memory& memory) {
    Clock::TimePoint now = clock.Now();
    delay_timer.Update(memory, now);
    tone_timer.Update(memory, now);
}

void Interpreter::CommitProgramCounter(Memory& memory, uint16_t next) {
#ifdef VIP8_DIAGNOSTICS
    if (next < Memory::PROGRAM_START || next > Memory::PROGRAM_LAST) {
        throw MakeFault(memory, FaultKind::ProgramCounterOutOfRange);
    }
#endif
    memory.WriteWord(Memory::PROGRAM_COUNTER_ADDR, next);
}

void Interpreter::SetIndex(Memory& memory, uint16_t value) {
#ifdef VIP8_DIAGNOSTICS
    // Glyphs sit below the program area, so I may point anywhere up to
    // the end of the program area
    if (value > Memory::PROGRAM_LAST) {
        throw MakeFault(memory, FaultKind::IndexOutOfRange);
    }
#endif
    memory.WriteWord(Memory::INDEX_ADDR, value);
}

void Interpreter::SetDelayTimer(Memory& memory, uint8_t jiffies) {
    delay_timer.Set(memory, jiffies, clock.Now());
}

void Interpreter::SetToneTimer(Memory& memory, uint8_t jiffies) {
    tone_timer.Set(memory, jiffies, clock.Now());
}

uint8_t Interpreter::NextRandomByte() {
    return rng.NextByte();
}

void Interpreter::PushReturnAddress(Memory& memory, uint16_t address) {
    uint16_t sp = GetStackPointer(memory);
#ifdef VIP8_DIAGNOSTICS
    if (sp >= Memory::STACK_LIMIT) {
        throw MakeFault(memory, FaultKind::StackOverflow);
    }
#endif
    memory.WriteWord(sp, address);
    memory.WriteWord(Memory::STACK_POINTER_ADDR, sp + 2);
}

uint16_t Interpreter::PopReturnAddress(Memory& memory) {
    uint16_t sp = GetStackPointer(memory);
#ifdef VIP8_DIAGNOSTICS
    if (sp <= Memory::STACK_START) {
        throw MakeFault(memory, FaultKind::StackUnderflow);
    }
#endif
    sp -= 2;
    memory.WriteWord(Memory::STACK_POINTER_ADDR, sp);
    return memory.ReadWord(sp);
}

Fault Interpreter::MakeFault(const Memory& memory, FaultKind kind) {
    uint16_t pc = GetProgramCounter(memory);
    return Fault(kind, memory.ReadWord(pc), pc);
}

// === Peripheral Interface ===

bool Interpreter::IsToneSounding(const Memory& memory) {
    return memory.Read(Memory::TONE_TIMER_ADDR) >= TONE_THRESHOLD;
}

void Interpreter::SetCurrentKeyPress(Memory& memory, std::optional<uint8_t> key) {
    HexKeypad::SetCurrentKey(memory, key);
}

InterpreterState Interpreter::GetState(const Memory& memory) {
    InterpreterState state;
    state.program_counter = GetProgramCounter(memory);
    state.instruction = memory.ReadWord(state.program_counter);
    state.index = GetIndex(memory);
    state.stack_pointer = GetStackPointer(memory);
    state.delay_timer = memory.Read(Memory::DELAY_TIMER_ADDR);
    state.tone_timer = memory.Read(Memory::TONE_TIMER_ADDR);
    state.key_status = memory.ReadWord(Memory::KEY_STATUS_ADDR);
    Memory::ConstRegisterFile registers = memory.Registers();
    Memory::ConstDisplayPage display = memory.DisplayBuffer();
    std::copy(registers.begin(), registers.end(), state.registers.begin());
    std::copy(display.begin(), display.end(), state.display.begin());
    return state;
}

std::ostream& operator<<(std::ostream& out, const InterpreterState& state) {
    std::ios_base::fmtflags flags = out.flags();
    char fill = out.fill();

    out << std::hex << std::uppercase << std::setfill('0')
        << "PC=$" << std::setw(4) << state.program_counter
        << " [" << std::setw(4) << state.instruction << " " << Disassemble(state.instruction) << "]"
        << " I=$" << std::setw(4) << state.index
        << " SP=$" << std::setw(4) << state.stack_pointer
        << " DT=" << std::setw(2) << static_cast<int>(state.delay_timer)
        << " ST=" << std::setw(2) << static_cast<int>(state.tone_timer)
        << " KEY=" << std::setw(4) << state.key_status
        << "\n ";
    for (size_t i = 0; i < state.registers.size(); i++) {
        out << " V" << i << "=" << std::setw(2) << static_cast<int>(state.registers[i]);
    }
    out << "\n";

    out.flags(flags);
    out.fill(fill);
    return out;
}
