#include <iostream>
#include <fstream>
#include <string>
#include <chrono>
#include <thread>
#include <iomanip>
#include <filesystem>

#include "Emulator.hpp"
#include "cpu/Random.hpp"
#include "timer/Clock.hpp"
#include "frontend/Window.hpp"
#include "frontend/Config.hpp"
#include "program/Program.hpp"

static constexpr int DEFAULT_INSTRUCTIONS_PER_SECOND = 300;
static constexpr int DEFAULT_SCALE = 10;
static constexpr uint64_t DEFAULT_HEADLESS_STEPS = 10000;

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options] program_file\n"
              << "\nOptions:\n"
              << "  --headless          Run without display (for testing)\n"
              << "  --steps <n>         Run N instructions then exit (headless)\n"
              << "  --dump-screen <f>   Dump screen to PBM file on exit\n"
              << "  --rate <hz>         Instructions per second (default: 300)\n"
              << "  --scale <n>         Window scale (1-30, default: 10)\n"
              << "  --seed <n>          Seed the random number generator\n"
              << "  --config <file>     Settings file (default: vip8.ini)\n"
              << "  --trace             Print interpreter state around every instruction\n"
              << "  --help              Show this help\n";
}

struct Args {
    std::string program_path;
    std::string dump_screen_path;
    std::string config_path = Config::DEFAULT_FILE;
    bool headless = false;
    bool trace = false;
    bool seeded = false;
    uint32_t seed = 0;
    uint64_t max_steps = 0;
    int rate = 0;
    int scale = 0;
};

bool ParseArgs(int argc, char* argv[], Args& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                PrintUsage(argv[0]);
                return false;
            } else if (arg == "--headless") {
                args.headless = true;
            } else if (arg == "--trace") {
                args.trace = true;
            } else if (arg == "--steps" && i + 1 < argc) {
                args.max_steps = std::stoull(argv[++i]);
            } else if (arg == "--dump-screen" && i + 1 < argc) {
                args.dump_screen_path = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
                args.seeded = true;
            } else if (arg == "--rate" && i + 1 < argc) {
                args.rate = std::stoi(argv[++i]);
                if (args.rate < 1) args.rate = 1;
            } else if (arg == "--scale" && i + 1 < argc) {
                args.scale = std::stoi(argv[++i]);
                if (args.scale < 1) args.scale = 1;
                if (args.scale > 30) args.scale = 30;
            } else if (arg[0] != '-') {
                args.program_path = arg;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return false;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        return false;
    }
    return true;
}

// The display page is already 1 bit per pixel, MSB first: exactly a P4 PBM body
bool DumpScreen(const Emulator& emu, const std::string& path) {
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        std::cerr << "Failed to write screen dump: " << path << "\n";
        return false;
    }
    file << "P4\n" << Window::WIDTH << " " << Window::HEIGHT << "\n";
    Memory::ConstDisplayPage display = emu.GetDisplayBuffer();
    file.write(reinterpret_cast<const char*>(display.data()), display.size());
    std::cout << "Screen dumped to: " << path << "\n";
    return static_cast<bool>(file);
}

void TracedStep(Emulator& emu, bool trace) {
    if (trace) {
        std::cerr << "Before instruction\n" << emu.GetState();
    }
    emu.Step();
    if (trace) {
        std::cerr << "After instruction\n" << emu.GetState();
    }
}

int RunHeadless(Emulator& emu, const Args& args) {
    uint64_t target = args.max_steps > 0 ? args.max_steps : DEFAULT_HEADLESS_STEPS;

    auto start = std::chrono::high_resolution_clock::now();

    for (uint64_t i = 0; i < target; i++) {
        TracedStep(emu, args.trace);
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

    std::cout << "\nExecuted " << emu.GetTotalSteps() << " instructions in " << duration.count() << "ms\n";
    std::cout << "\nInterpreter state:\n" << emu.GetState();

    if (!args.dump_screen_path.empty() && !DumpScreen(emu, args.dump_screen_path)) {
        return 1;
    }
    return 0;
}

int RunGUI(Emulator& emu, Window& window, int rate) {
    std::cout << "\n=== Starting Emulation ===\n";
    std::cout << "Keypad: 1234 / QWER / ASDF / ZXCV\n";
    std::cout << "Press ESC to quit, F12 for a screenshot\n\n";

    const auto instruction_duration = std::chrono::microseconds(1000000 / rate);

    // Rate tracking
    uint64_t report_steps = 0;
    auto report_start = std::chrono::steady_clock::now();

    uint64_t tick_count = 0;
    const auto run_start = std::chrono::steady_clock::now();

    while (window.ProcessEvents()) {
        emu.Tick(window, window, window);
        tick_count++;
        report_steps++;

        // Rate tracking: print every second
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - report_start);
        if (elapsed.count() >= 1000) {
            double ips = report_steps * 1000.0 / elapsed.count();
            std::cerr << "[IPS: " << std::fixed << std::setprecision(1) << ips << "] "
                      << "PC=$" << std::hex << emu.GetState().program_counter << std::dec << std::endl;
            report_steps = 0;
            report_start = now;
        }

        // Absolute schedule, so a late tick is caught up instead of drifting
        std::this_thread::sleep_until(run_start + tick_count * instruction_duration);
    }

    return 0;
}

int main(int argc, char* argv[]) {
    std::cout << R"(
   +---------------------------------------+
   |      VIP8 - COSMAC VIP CHIP-8         |
   +---------------------------------------+
)" << "\n";

    Args args;
    if (!ParseArgs(argc, argv, args)) {
        return 1;
    }

    if (args.program_path.empty()) {
        std::cerr << "Error: No program file specified\n";
        PrintUsage(argv[0]);
        return 1;
    }

    if (!Config::Instance().Load(args.config_path)) {
        std::cout << "No settings file at " << args.config_path << ", using defaults\n";
    }
    int rate = args.rate > 0 ? args.rate
        : Config::Instance().GetInt("InstructionsPerSecond", DEFAULT_INSTRUCTIONS_PER_SECOND);
    int scale = args.scale > 0 ? args.scale : Config::Instance().GetInt("Scale", DEFAULT_SCALE);
    if (rate < 1) rate = DEFAULT_INSTRUCTIONS_PER_SECOND;

    Program program;
    if (!program.LoadFile(args.program_path)) {
        std::cerr << "Failed to load program: " << args.program_path;
        if (program.GetLastError() != MemoryError::None) {
            std::cerr << ": " << ToString(program.GetLastError(), program.GetRejectedSize());
        }
        std::cerr << "\n";
        return 1;
    }
    std::cout << program.GetInfo() << "\n";

    std::unique_ptr<RandomSource> rng = args.seeded
        ? std::make_unique<MersenneRandom>(args.seed)
        : std::make_unique<MersenneRandom>();
    Emulator emu(std::move(rng), std::make_unique<SteadyClock>());

    MemoryError loaded = emu.LoadProgram(program);
    if (loaded != MemoryError::None) {
        std::cerr << "Failed to load program into memory: "
                  << ToString(loaded, program.GetSize()) << "\n";
        return 1;
    }

    emu.Reset();

    try {
        if (args.headless) {
            return RunHeadless(emu, args);
        }

        Window window;
        if (!window.Init("VIP8 - " + program.GetName(), scale)) {
            std::cerr << "Failed to initialize window\n";
            return 1;
        }
        window.DrawBuffer(emu.GetDisplayBuffer());

        // Trace output would swamp the GUI rate, only headless honours it
        if (args.trace) {
            std::cerr << "--trace is ignored without --headless\n";
        }
        return RunGUI(emu, window, rate);
    } catch (const Fault& fault) {
        std::cerr << "\nCHIP-8 fault: " << fault.what() << "\n"
                  << "Interpreter state:\n" << emu.GetState();
        if (!args.dump_screen_path.empty() && !DumpScreen(emu, args.dump_screen_path)) {
            std::cerr << "Screen at the fault was not saved\n";
        }
        return 1;
    }
}
