#include "TestSupport.hpp"
#include "timer/Timer.hpp"

using namespace std::chrono_literals;

class CountdownTimerTest : public ::testing::Test {
protected:
    Memory memory;
    FakeClock clock;
    CountdownTimer timer{Memory::DELAY_TIMER_ADDR};

    uint8_t Value() const { return memory.Read(Memory::DELAY_TIMER_ADDR); }
};

TEST_F(CountdownTimerTest, CountsDownInJiffies) {
    timer.Set(memory, 2, clock.Now());
    EXPECT_EQ(2, Value());
    EXPECT_TRUE(timer.IsRunning());

    clock.Advance(16ms);
    timer.Update(memory, clock.Now());
    EXPECT_EQ(1, Value());

    clock.Advance(17ms);
    timer.Update(memory, clock.Now());
    EXPECT_EQ(0, Value());
    EXPECT_FALSE(timer.IsRunning());
}

TEST_F(CountdownTimerTest, ExpiryIsWholeMilliseconds) {
    timer.Set(memory, 60, clock.Now());
    EXPECT_EQ(clock.Now() + 1000ms, timer.GetExpiry());

    timer.Set(memory, 1, clock.Now());
    EXPECT_EQ(clock.Now() + 16ms, timer.GetExpiry());
}

TEST_F(CountdownTimerTest, TracksWallClockNotUpdateCount) {
    timer.Set(memory, 60, clock.Now());
    clock.Advance(500ms);
    timer.Update(memory, clock.Now());
    EXPECT_EQ(30, Value());

    clock.Advance(2s);
    timer.Update(memory, clock.Now());
    EXPECT_EQ(0, Value());
}

TEST_F(CountdownTimerTest, SettingZeroStops) {
    timer.Set(memory, 10, clock.Now());
    timer.Set(memory, 0, clock.Now());
    EXPECT_EQ(0, Value());
    EXPECT_FALSE(timer.IsRunning());
}

TEST_F(CountdownTimerTest, StoppedTimerLeavesRegisterAlone) {
    memory.Write(Memory::DELAY_TIMER_ADDR, 7);
    timer.Update(memory, clock.Now());
    EXPECT_EQ(7, Value());
}

using InterpreterTimerTest = InterpreterFixture;

TEST_F(InterpreterTimerTest, DelayTimerIsVisibleToTheProgram) {
    Load({0x6002, 0xF015, 0xF307});
    Run(2);
    clock.Advance(16ms);
    Run(1);
    EXPECT_EQ(1, V(3));
}

TEST_F(InterpreterTimerTest, ToneNeedsAtLeastTwoJiffies) {
    Load({0x6002, 0xF018, 0x1204});
    Run(2);
    EXPECT_TRUE(Interpreter::IsToneSounding(memory));

    clock.Advance(1ms);
    Run(1);
    EXPECT_EQ(1, memory.Read(Memory::TONE_TIMER_ADDR));
    EXPECT_FALSE(Interpreter::IsToneSounding(memory));

    Load({0x6001, 0xF018});
    Run(2);
    EXPECT_FALSE(Interpreter::IsToneSounding(memory));
}

TEST_F(InterpreterTimerTest, ResetStopsTimers) {
    Load({0x6030, 0xF015, 0xF018, 0x1206});
    Run(3);
    interpreter.Reset(memory);
    Run(1);
    EXPECT_EQ(0, memory.Read(Memory::DELAY_TIMER_ADDR));
    EXPECT_EQ(0, memory.Read(Memory::TONE_TIMER_ADDR));
}
