#pragma once
#include <vector>

// Raw device state captured once per frame by InputGatherSystem.
// Plain data, no raylib types, so PlayerInputSystem can be tested headless.

struct GamepadState {
    int id = -1;
    bool dpad_up = false;
    bool dpad_down = false;
    float left_y = 0.0f;    // raylib convention: negative is up
};

struct InputRecord {
    // Keyboard
    bool key_up = false;
    bool key_down = false;
    bool key_w = false;
    bool key_s = false;

    // Gamepads (filtered/real only)
    std::vector<GamepadState> gamepads;
};
