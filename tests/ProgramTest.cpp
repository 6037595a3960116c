#include "TestSupport.hpp"
#include "program/Program.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ProgramFileTest : public ::testing::Test {
protected:
    fs::path path = fs::temp_directory_path() / "vip8_program_test.ch8";

    void TearDown() override {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void WriteFile(const std::vector<uint8_t>& bytes) {
        std::ofstream file(path, std::ios::binary);
        file.write(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
};

TEST(Program, RejectsEmptyAndOversizedPrograms) {
    Program program;
    EXPECT_EQ(MemoryError::EmptyProgram, program.LoadBytes("empty", {}));
    EXPECT_FALSE(program.IsLoaded());

    EXPECT_EQ(0u, program.GetRejectedSize());

    std::vector<uint8_t> too_large(Memory::MAX_PROGRAM_SIZE + 7, 0x00);
    EXPECT_EQ(MemoryError::ProgramTooLarge, program.LoadBytes("big", too_large));
    EXPECT_EQ(MemoryError::ProgramTooLarge, program.GetLastError());
    EXPECT_EQ(Memory::MAX_PROGRAM_SIZE + 7, program.GetRejectedSize());
    EXPECT_FALSE(program.IsLoaded());

    EXPECT_EQ(MemoryError::None, program.LoadBytes("small", {0x00, 0xE0}));
    EXPECT_EQ(0u, program.GetRejectedSize());
}

TEST(Program, ErrorMessageNamesTheRejectedSize) {
    EXPECT_EQ("CHIP-8 program is too large (3239 bytes, limit 3232)",
              ToString(MemoryError::ProgramTooLarge, Memory::MAX_PROGRAM_SIZE + 7));
    EXPECT_EQ("CHIP-8 program is empty (0 bytes)", ToString(MemoryError::EmptyProgram, 0));
}

TEST(Program, SharesSizeRulesWithMemory) {
    for (size_t size : {size_t(0), size_t(1), Memory::MAX_PROGRAM_SIZE, Memory::MAX_PROGRAM_SIZE + 1}) {
        Program program;
        Memory memory;
        std::vector<uint8_t> bytes(size, 0x12);
        EXPECT_EQ(Memory::ValidateProgram(size), program.LoadBytes("sized", bytes)) << size;
        EXPECT_EQ(Memory::ValidateProgram(size), memory.LoadProgram(bytes)) << size;
    }
}

TEST(Program, KeepsBytesAsGiven) {
    Program program;
    EXPECT_EQ(MemoryError::None, program.LoadBytes("pong", ProgramBytes({0x1234, 0xABCD})));
    EXPECT_TRUE(program.IsLoaded());
    EXPECT_EQ("pong", program.GetName());
    EXPECT_EQ(4u, program.GetSize());
    EXPECT_EQ(0xAB, program.Bytes()[2]);
}

TEST(Program, InfoSummarizesTheProgram) {
    Program program;
    std::vector<uint8_t> bytes(12, 0xEE);
    bytes[0] = 0x12;
    bytes[1] = 0x0A;
    ASSERT_EQ(MemoryError::None, program.LoadBytes("maze", bytes));

    std::string info = program.GetInfo();
    EXPECT_NE(std::string::npos, info.find("Name: maze"));
    EXPECT_NE(std::string::npos, info.find("Size: 12 bytes (3220 free)"));
    EXPECT_NE(std::string::npos, info.find("Head: 12 0A EE EE EE EE EE EE EE EE\n"));
}

TEST_F(ProgramFileTest, LoadsFileNamedAfterItsStem) {
    WriteFile({0x00, 0xE0, 0x12, 0x00});

    Program program;
    ASSERT_TRUE(program.LoadFile(path.string()));
    EXPECT_EQ("vip8_program_test", program.GetName());
    EXPECT_EQ(ProgramBytes({0x00E0, 0x1200}), program.Bytes());
}

TEST_F(ProgramFileTest, EmptyFileIsAnError) {
    WriteFile({});

    Program program;
    EXPECT_FALSE(program.LoadFile(path.string()));
    EXPECT_EQ(MemoryError::EmptyProgram, program.GetLastError());
}

TEST_F(ProgramFileTest, OversizedFileReportsItsSize) {
    WriteFile(std::vector<uint8_t>(Memory::MAX_PROGRAM_SIZE + 7, 0xA2));

    Program program;
    EXPECT_FALSE(program.LoadFile(path.string()));
    EXPECT_EQ(MemoryError::ProgramTooLarge, program.GetLastError());
    EXPECT_EQ(Memory::MAX_PROGRAM_SIZE + 7, program.GetRejectedSize());
}

TEST_F(ProgramFileTest, MissingFileIsNotAMemoryError) {
    Program program;
    EXPECT_EQ(MemoryError::EmptyProgram, program.LoadBytes("empty", {}));

    EXPECT_FALSE(program.LoadFile((fs::temp_directory_path() / "vip8_no_such_program.ch8").string()));
    EXPECT_EQ(MemoryError::None, program.GetLastError());
    EXPECT_FALSE(program.IsLoaded());
}
