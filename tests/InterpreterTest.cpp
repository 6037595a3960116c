#include "TestSupport.hpp"
#include "memory/Glyphs.hpp"

#include <sstream>

using ::testing::Return;

using InterpreterTest = InterpreterFixture;

TEST_F(InterpreterTest, ResetPreparesWorkArea) {
    memory.Registers()[3] = 0x99;
    memory.DisplayBuffer()[10] = 0xFF;
    memory.WriteWord(Memory::INDEX_ADDR, 0x345);

    interpreter.Reset(memory);

    EXPECT_EQ(Memory::PROGRAM_START, PC());
    EXPECT_EQ(Memory::STACK_START, SP());
    EXPECT_EQ(0, I());
    EXPECT_EQ(0, V(3));
    EXPECT_EQ(0, memory.DisplayBuffer()[10]);
    EXPECT_EQ(Memory::GLYPH_START + 5, GlyphAddress(memory, 1));
}

TEST_F(InterpreterTest, Jump) {
    Load({0x1234});
    Run(1);
    EXPECT_EQ(0x234, PC());
}

TEST_F(InterpreterTest, JumpOffsetByV0) {
    Load({0x6004, 0xB300});
    Run(2);
    EXPECT_EQ(0x304, PC());
}

TEST_F(InterpreterTest, CallPushesItsOwnAddressAndReturnResumesAfterIt) {
    Load({0x2206, 0x0000, 0x0000, 0x00EE});

    Run(1);
    EXPECT_EQ(0x206, PC());
    EXPECT_EQ(Memory::STACK_START + 2, SP());
    EXPECT_EQ(0x200, memory.ReadWord(Memory::STACK_START));

    Run(1);
    EXPECT_EQ(0x202, PC());
    EXPECT_EQ(Memory::STACK_START, SP());
}

TEST_F(InterpreterTest, TwelveNestedCallsUnwind) {
    // main: CALL sub1, then spin. sub k: CALL sub k+1, RET. sub 12: RET.
    std::vector<uint8_t> program = ProgramBytes({0x2204, 0x1202});
    for (uint16_t k = 1; k < Memory::STACK_SLOTS; k++) {
        uint16_t callee = Memory::PROGRAM_START + 4 * (k + 1);
        program.push_back(0x20 | (callee >> 8));
        program.push_back(callee & 0xFF);
        program.push_back(0x00);
        program.push_back(0xEE);
    }
    program.push_back(0x00);
    program.push_back(0xEE);
    LoadBytes(program);

    Run(Memory::STACK_SLOTS);
    EXPECT_EQ(Memory::STACK_LIMIT, SP());
    EXPECT_EQ(Memory::PROGRAM_START + 4 * Memory::STACK_SLOTS, PC());

    // Each return lands just past its own call, innermost first
    for (uint16_t depth = Memory::STACK_SLOTS; depth > 0; depth--) {
        Run(1);
        uint16_t call_site = Memory::PROGRAM_START + 4 * (depth - 1);
        EXPECT_EQ(call_site + Interpreter::INSTRUCTION_SIZE, PC()) << "return from depth " << depth;
        EXPECT_EQ(Memory::STACK_START + 2 * (depth - 1), SP());
    }
    EXPECT_EQ(0x202, PC());
    EXPECT_EQ(Memory::STACK_START, SP());

    Run(1);
    EXPECT_EQ(0x202, PC());
}

TEST_F(InterpreterTest, SkipIfEqualImmediate) {
    Load({0x6A2A, 0x3A2A, 0x0000, 0x3A2B});
    Run(2);
    EXPECT_EQ(0x206, PC());
    Run(1);
    EXPECT_EQ(0x208, PC());
}

TEST_F(InterpreterTest, SkipIfNotEqualImmediate) {
    Load({0x6A2A, 0x4A2B, 0x0000, 0x4A2A});
    Run(2);
    EXPECT_EQ(0x206, PC());
    Run(1);
    EXPECT_EQ(0x208, PC());
}

TEST_F(InterpreterTest, SkipOnRegisterComparison) {
    Load({0x6105, 0x6205, 0x5120, 0x0000, 0x9120, 0x6306, 0x9130});
    Run(3);
    EXPECT_EQ(0x208, PC());
    Run(1);
    EXPECT_EQ(0x20A, PC());
    Run(2);
    EXPECT_EQ(0x210, PC());
}

TEST_F(InterpreterTest, AddImmediateWrapsWithoutFlag) {
    Load({0x6F00, 0x60FF, 0x7002});
    Run(3);
    EXPECT_EQ(0x01, V(0));
    EXPECT_EQ(0x00, V(0xF));
}

TEST_F(InterpreterTest, LogicalOperations) {
    Load({0x600C, 0x610A, 0x8200, 0x8211, 0x8300, 0x8312, 0x8400, 0x8413});
    Run(8);
    EXPECT_EQ(0x0E, V(2));
    EXPECT_EQ(0x08, V(3));
    EXPECT_EQ(0x06, V(4));
}

TEST_F(InterpreterTest, AddSetsCarry) {
    Load({0x60FF, 0x6103, 0x8014});
    Run(3);
    EXPECT_EQ(0x02, V(0));
    EXPECT_EQ(1, V(0xF));

    Load({0x6010, 0x6103, 0x8014});
    Run(3);
    EXPECT_EQ(0x13, V(0));
    EXPECT_EQ(0, V(0xF));
}

TEST_F(InterpreterTest, SubtractFlagMeansNoBorrow) {
    Load({0x60F0, 0x610F, 0x8015});
    Run(3);
    EXPECT_EQ(0xE1, V(0));
    EXPECT_EQ(1, V(0xF));

    Load({0x600F, 0x61F0, 0x8015});
    Run(3);
    EXPECT_EQ(0x1F, V(0));
    EXPECT_EQ(0, V(0xF));
}

TEST_F(InterpreterTest, ReverseSubtract) {
    Load({0x600F, 0x61F0, 0x8017});
    Run(3);
    EXPECT_EQ(0xE1, V(0));
    EXPECT_EQ(1, V(0xF));
}

TEST_F(InterpreterTest, FlagOverwritesResultWhenVfIsTheDestination) {
    Load({0x6FFF, 0x6101, 0x8F14});
    Run(3);
    EXPECT_EQ(1, V(0xF));
}

TEST_F(InterpreterTest, ShiftsTakeTheSourceRegister) {
    Load({0x6105, 0x8016, 0x6281, 0x832E});
    Run(2);
    EXPECT_EQ(0x02, V(0));
    EXPECT_EQ(0x05, V(1));
    EXPECT_EQ(1, V(0xF));

    Run(2);
    EXPECT_EQ(0x02, V(3));
    EXPECT_EQ(1, V(0xF));
}

TEST_F(InterpreterTest, RandomIsMaskedByImmediate) {
    EXPECT_CALL(rng, NextByte()).WillOnce(Return(0xAB));
    Load({0xC30F});
    Run(1);
    EXPECT_EQ(0x0B, V(3));
}

TEST_F(InterpreterTest, StoreDecimalDigits) {
    Load({0x60FE, 0xA300, 0xF033});
    Run(3);
    EXPECT_EQ(2, memory.Read(0x300));
    EXPECT_EQ(5, memory.Read(0x301));
    EXPECT_EQ(4, memory.Read(0x302));
    EXPECT_EQ(0x300, I());
}

TEST_F(InterpreterTest, StoreRegistersAdvancesIndex) {
    Load({0x6001, 0x6102, 0x6203, 0x6344, 0xA300, 0xF255});
    Run(6);
    EXPECT_EQ(1, memory.Read(0x300));
    EXPECT_EQ(2, memory.Read(0x301));
    EXPECT_EQ(3, memory.Read(0x302));
    EXPECT_EQ(0, memory.Read(0x303));
    EXPECT_EQ(0x303, I());
}

TEST_F(InterpreterTest, LoadRegistersAdvancesIndex) {
    Load({0xA400, 0xF165});
    memory.Write(0x400, 0x11);
    memory.Write(0x401, 0x22);
    memory.Write(0x402, 0x33);
    Run(2);
    EXPECT_EQ(0x11, V(0));
    EXPECT_EQ(0x22, V(1));
    EXPECT_EQ(0x00, V(2));
    EXPECT_EQ(0x402, I());
}

TEST_F(InterpreterTest, IndexPointsAtGlyph) {
    Load({0x601A, 0xF029});
    Run(2);
    EXPECT_EQ(Memory::GLYPH_START + 0xA * Memory::GLYPH_BYTES, I());
}

TEST_F(InterpreterTest, AddToIndex) {
    Load({0xA300, 0x6010, 0xF01E});
    Run(3);
    EXPECT_EQ(0x310, I());
}

TEST_F(InterpreterTest, UnknownInstructionFaults) {
    Load({0x6001, 0x5121});
    Run(1);

    try {
        interpreter.Step(memory);
        FAIL() << "expected a fault";
    } catch (const Fault& fault) {
        EXPECT_EQ(FaultKind::UnknownInstruction, fault.GetKind());
        EXPECT_EQ(0x5121, fault.GetInstruction());
        EXPECT_EQ(0x202, fault.GetAddress());
        EXPECT_NE(std::string::npos, std::string(fault.what()).find("$5121 at $0202"));
    }
    EXPECT_EQ(0x202, PC());
}

TEST_F(InterpreterTest, MachineLanguageSubroutineFaults) {
    Load({0x0123});
    EXPECT_EQ(FaultKind::NativeSubroutine, StepFault());
    EXPECT_EQ(0x200, PC());
}

TEST_F(InterpreterTest, StateSnapshotAndTrace) {
    Load({0x6A2A, 0xA123});
    Run(2);

    InterpreterState state = interpreter.GetState(memory);
    EXPECT_EQ(0x204, state.program_counter);
    EXPECT_EQ(0x123, state.index);
    EXPECT_EQ(0x2A, state.registers[0xA]);

    std::ostringstream out;
    out << state;
    EXPECT_NE(std::string::npos, out.str().find("PC=$0204 [0000 SYS $0000]"));
    EXPECT_NE(std::string::npos, out.str().find("I=$0123"));
    EXPECT_NE(std::string::npos, out.str().find("VA=2A"));
}

#ifdef VIP8_DIAGNOSTICS

TEST_F(InterpreterTest, ThirteenthNestedCallOverflows) {
    std::vector<uint8_t> program;
    for (uint16_t k = 1; k <= Memory::STACK_SLOTS + 1; k++) {
        uint16_t callee = Memory::PROGRAM_START + 2 * k;
        program.push_back(0x20 | (callee >> 8));
        program.push_back(callee & 0xFF);
    }
    LoadBytes(program);

    Run(Memory::STACK_SLOTS);
    EXPECT_EQ(FaultKind::StackOverflow, StepFault());
    EXPECT_EQ(Memory::STACK_LIMIT, SP());
}

TEST_F(InterpreterTest, ReturnWithEmptyStackUnderflows) {
    Load({0x00EE});
    EXPECT_EQ(FaultKind::StackUnderflow, StepFault());
    EXPECT_EQ(Memory::STACK_START, SP());
}

TEST_F(InterpreterTest, JumpOutsideProgramAreaFaults) {
    Load({0x1EA0});
    EXPECT_EQ(FaultKind::ProgramCounterOutOfRange, StepFault());
    EXPECT_EQ(0x200, PC());

    Load({0x11FE});
    EXPECT_EQ(FaultKind::ProgramCounterOutOfRange, StepFault());
}

TEST_F(InterpreterTest, IndexBeyondProgramAreaFaults) {
    Load({0xAE9F, 0x6001, 0xF01E});
    Run(2);
    EXPECT_EQ(Memory::PROGRAM_LAST, I());
    EXPECT_EQ(FaultKind::IndexOutOfRange, StepFault());

    Load({0xAEA0});
    EXPECT_EQ(FaultKind::IndexOutOfRange, StepFault());
}

#endif
