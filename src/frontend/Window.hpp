#pragma once

#include <SDL2/SDL.h>
#include <string>
#include <array>
#include <optional>

#include "../Peripherals.hpp"

/**
 * Frontend Window - SDL2 Window, Keypad and Tone Indicator
 *
 * Handles:
 * - Window creation and management
 * - Display refresh page (64x32, 1 bit per pixel) scaled up
 * - Host keyboard to hex keypad mapping
 * - Tone state, shown by tinting the background (no sound synthesis)
 * - Screenshots (F12)
 *
 * Keypad layout:
 *   1 2 3 C        1 2 3 4
 *   4 5 6 D   <-   Q W E R
 *   7 8 9 E        A S D F
 *   A 0 B F        Z X C V
 */
class Window : public Screen, public HexKeyboard, public Tone {
public:
    static constexpr int WIDTH = 64;
    static constexpr int HEIGHT = 32;

    Window();
    ~Window() override;

    // Initialize SDL2 and create window
    bool Init(const std::string& title, int scale = 10);

    // Handle events, returns false if quit requested
    bool ProcessEvents();

    // === Screen ===
    void DrawBuffer(Memory::ConstDisplayPage display) override;

    // === HexKeyboard ===
    std::optional<uint8_t> GetCurrentPressedKey() const override;

    // === Tone ===
    void StartTone() override;
    void StopTone() override;
    bool IsToneOn() const override { return tone_on; }

    // Screenshot
    void SaveScreenshot();

    // Save window state
    void SaveWindowState();

private:
    SDL_Window* window;
    SDL_Renderer* renderer;
    SDL_Texture* texture;

    int scale;

    // Keyboard state
    std::array<bool, SDL_NUM_SCANCODES> keys_current;

    // Scancode for each hex key 0-F
    static const SDL_Scancode KEYMAP[16];

    // Colors (ARGB8888), from Config
    uint32_t foreground;
    uint32_t background;
    uint32_t tone_color;

    // Pixel buffer for texture update
    std::array<uint32_t, WIDTH * HEIGHT> pixels;

    bool tone_on;
    bool quit_requested;
};
