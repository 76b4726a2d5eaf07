#include "input_gather.hpp"
#include "../input_state.hpp"
#include <raylib.h>
#include <string>

static bool IsRealGamepad(int i) {
    if (!IsGamepadAvailable(i)) return false;

    const char* name = GetGamepadName(i);
    if (GetGamepadAxisCount(i) < 2) return false;

    if (!name) return false;
    std::string n = name;
    const char* blacklist[] = {
        "Keyboard", "Mouse", "Trackpad", "Touchpad",
        "Accelerometer", "Sensor", "Consumer Control", "System Control",
        "Power Button", "Speaker"
    };

    for (const char* b : blacklist) {
        if (n.find(b) != std::string::npos) return false;
    }
    return true;
}

void InputGatherSystem::Update(ecs::World& world) {
    InputRecord* input_ptr = world.try_resource<InputRecord>();
    if (!input_ptr) {
        world.set_resource(InputRecord{});
        input_ptr = world.try_resource<InputRecord>();
    }
    auto& input = *input_ptr;

    // 1. Keyboard
    input.key_up   = IsKeyDown(KEY_UP);
    input.key_down = IsKeyDown(KEY_DOWN);
    input.key_w    = IsKeyDown(KEY_W);
    input.key_s    = IsKeyDown(KEY_S);

    // 2. Gamepads
    input.gamepads.clear();
    for (int i = 0; i < 4; i++) {
        if (!IsRealGamepad(i)) continue;
        GamepadState gp;
        gp.id        = i;
        gp.dpad_up   = IsGamepadButtonDown(i, GAMEPAD_BUTTON_LEFT_FACE_UP);
        gp.dpad_down = IsGamepadButtonDown(i, GAMEPAD_BUTTON_LEFT_FACE_DOWN);
        gp.left_y    = GetGamepadAxisMovement(i, GAMEPAD_AXIS_LEFT_Y);
        input.gamepads.push_back(gp);
    }
}
