#include "Window.hpp"
#include "Config.hpp"
#include <iostream>
#include <cstring>
#include <filesystem>
#include <chrono>
#include <ctime>

const SDL_Scancode Window::KEYMAP[16] = {
    SDL_SCANCODE_X,  // 0
    SDL_SCANCODE_1,  // 1
    SDL_SCANCODE_2,  // 2
    SDL_SCANCODE_3,  // 3
    SDL_SCANCODE_Q,  // 4
    SDL_SCANCODE_W,  // 5
    SDL_SCANCODE_E,  // 6
    SDL_SCANCODE_A,  // 7
    SDL_SCANCODE_S,  // 8
    SDL_SCANCODE_D,  // 9
    SDL_SCANCODE_Z,  // A
    SDL_SCANCODE_C,  // B
    SDL_SCANCODE_4,  // C
    SDL_SCANCODE_R,  // D
    SDL_SCANCODE_F,  // E
    SDL_SCANCODE_V   // F
};

Window::Window()
    : window(nullptr)
    , renderer(nullptr)
    , texture(nullptr)
    , scale(10)
    , foreground(0xFFFFFFFF)
    , background(0xFF000000)
    , tone_color(0xFF402020)
    , tone_on(false)
    , quit_requested(false)
{
    keys_current.fill(false);
    pixels.fill(background);
}

Window::~Window() {
    SaveWindowState();
    if (texture) SDL_DestroyTexture(texture);
    if (renderer) SDL_DestroyRenderer(renderer);
    if (window) SDL_DestroyWindow(window);
    SDL_Quit();
}

bool Window::Init(const std::string& title, int window_scale) {
    scale = window_scale;

    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return false;
    }

    // Load saved position or use centered
    int x = Config::Instance().GetInt("WindowX", SDL_WINDOWPOS_CENTERED);
    int y = Config::Instance().GetInt("WindowY", SDL_WINDOWPOS_CENTERED);
    int w = Config::Instance().GetInt("WindowWidth", WIDTH * scale);
    int h = Config::Instance().GetInt("WindowHeight", HEIGHT * scale);

    window = SDL_CreateWindow(
        title.c_str(), x, y, w, h,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );

    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    // Restore maximized state
    if (Config::Instance().GetInt("Maximized", 0)) {
        SDL_MaximizeWindow(window);
    }

    // No VSYNC: main paces instructions, not frames
    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);

    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        return false;
    }

    SDL_RenderSetLogicalSize(renderer, WIDTH, HEIGHT);

    texture = SDL_CreateTexture(
        renderer,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        WIDTH, HEIGHT
    );

    if (!texture) {
        std::cerr << "SDL_CreateTexture failed: " << SDL_GetError() << "\n";
        return false;
    }

    foreground = Config::Instance().GetColor("ForegroundColor", foreground);
    background = Config::Instance().GetColor("BackgroundColor", background);
    tone_color = Config::Instance().GetColor("ToneColor", tone_color);

    return true;
}

void Window::SaveWindowState() {
    if (!window) return;

    Uint32 flags = SDL_GetWindowFlags(window);
    bool maximized = flags & SDL_WINDOW_MAXIMIZED;

    Config::Instance().SetInt("Maximized", maximized ? 1 : 0);

    if (!maximized) {
        int x, y, w, h;
        SDL_GetWindowPosition(window, &x, &y);
        SDL_GetWindowSize(window, &w, &h);
        Config::Instance().SetInt("WindowX", x);
        Config::Instance().SetInt("WindowY", y);
        Config::Instance().SetInt("WindowWidth", w);
        Config::Instance().SetInt("WindowHeight", h);
    }

    Config::Instance().SetColor("ForegroundColor", foreground);
    Config::Instance().SetColor("BackgroundColor", background);
    Config::Instance().SetColor("ToneColor", tone_color);
    if (!Config::Instance().Save()) {
        std::cerr << "Failed to save settings\n";
    }
}

void Window::DrawBuffer(Memory::ConstDisplayPage display) {
    if (!renderer) return;

    // Unpack 1 bit per pixel, MSB first
    uint32_t off = tone_on ? tone_color : background;
    for (int y = 0; y < HEIGHT; y++) {
        for (int x = 0; x < WIDTH; x++) {
            uint8_t byte = display[y * (WIDTH / 8) + x / 8];
            bool lit = (byte >> (7 - (x % 8))) & 0x01;
            pixels[y * WIDTH + x] = lit ? foreground : off;
        }
    }

    SDL_UpdateTexture(texture, nullptr, pixels.data(), WIDTH * sizeof(uint32_t));
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderCopy(renderer, texture, nullptr, nullptr);
    SDL_RenderPresent(renderer);
}

bool Window::ProcessEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
            case SDL_QUIT:
                quit_requested = true;
                return false;

            case SDL_KEYDOWN:
                if (event.key.keysym.scancode < SDL_NUM_SCANCODES) {
                    keys_current[event.key.keysym.scancode] = true;
                }

                switch (event.key.keysym.sym) {
                    case SDLK_ESCAPE: quit_requested = true; return false;
                    case SDLK_F12: SaveScreenshot(); break;
                }
                break;

            case SDL_KEYUP:
                if (event.key.keysym.scancode < SDL_NUM_SCANCODES) {
                    keys_current[event.key.keysym.scancode] = false;
                }
                break;
        }
    }

    return !quit_requested;
}

std::optional<uint8_t> Window::GetCurrentPressedKey() const {
    // The VIP keypad reports one key, lowest wins
    for (uint8_t key = 0; key < 16; key++) {
        if (keys_current[KEYMAP[key]]) {
            return key;
        }
    }
    return std::nullopt;
}

void Window::StartTone() {
    tone_on = true;
}

void Window::StopTone() {
    tone_on = false;
}

void Window::SaveScreenshot() {
    std::filesystem::create_directories("screenshots");

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    char filename[64];
    std::strftime(filename, sizeof(filename), "screenshots/%Y%m%d_%H%M%S.bmp", std::localtime(&time));

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, WIDTH, HEIGHT, 32, SDL_PIXELFORMAT_ARGB8888);
    if (!surface) {
        std::cerr << "Screenshot failed: " << SDL_GetError() << "\n";
        return;
    }
    std::memcpy(surface->pixels, pixels.data(), WIDTH * HEIGHT * sizeof(uint32_t));
    if (SDL_SaveBMP(surface, filename) != 0) {
        std::cerr << "Screenshot failed: " << SDL_GetError() << "\n";
    } else {
        std::cout << "Screenshot saved: " << filename << "\n";
    }
    SDL_FreeSurface(surface);
}
