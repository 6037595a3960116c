#include "Emulator.hpp"

#include "cpu/Random.hpp"
#include "timer/Clock.hpp"
#include "program/Program.hpp"

Emulator::Emulator()
    : Emulator(std::make_unique<MersenneRandom>(), std::make_unique<SteadyClock>())
{
}

Emulator::Emulator(std::unique_ptr<RandomSource> random_source, std::unique_ptr<Clock> wall_clock)
    : rng(std::move(random_source))
    , clock(std::move(wall_clock))
    , memory(std::make_unique<Memory>())
    , interpreter(std::make_unique<Interpreter>(*rng, *clock))
    , total_steps(0)
{
}

Emulator::~Emulator() = default;

// === Initialization ===

MemoryError Emulator::LoadProgram(const Program& program) {
    return memory->LoadProgram(program.Bytes());
}

void Emulator::Reset() {
    interpreter->Reset(*memory);
    total_steps = 0;
}

// === Execution ===

void Emulator::Step() {
    interpreter->Step(*memory);
    total_steps++;
}

/**
 * Tick - One pass of the pacing loop
 *
 * The screen is refreshed every tick, not only after DXYN, so the
 * frontend's event loop keeps running even while the program spins.
 */
void Emulator::Tick(Screen& screen, Tone& tone, HexKeyboard& keyboard) {
    Step();

    screen.DrawBuffer(memory->DisplayBuffer());

    bool sounding = IsToneSounding();
    if (sounding && !tone.IsToneOn()) {
        tone.StartTone();
    } else if (!sounding && tone.IsToneOn()) {
        tone.StopTone();
    }

    SetKey(keyboard.GetCurrentPressedKey());
}

// === Peripheral Signals ===

bool Emulator::IsToneSounding() const {
    return Interpreter::IsToneSounding(*memory);
}

void Emulator::SetKey(std::optional<uint8_t> key) {
    Interpreter::SetCurrentKeyPress(*memory, key);
}

// === Debug Access ===

InterpreterState Emulator::GetState() const {
    return Interpreter::GetState(*memory);
}
