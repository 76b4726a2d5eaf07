#include "player_input.hpp"
#include "../world_access.hpp"

using namespace ecs;

PlayerInput PlayerInputSystem::map(const InputRecord& record) {
    PlayerInput input;

    // 1. Keyboard
    input.up   = record.key_up   || record.key_w;
    input.down = record.key_down || record.key_s;

    // 2. Gamepad
    const float deadzone = 0.5f;
    for (const auto& gp : record.gamepads) {
        if (gp.dpad_up   || gp.left_y < -deadzone) input.up = true;
        if (gp.dpad_down || gp.left_y >  deadzone) input.down = true;
    }
    return input;
}

void PlayerInputSystem::Update(World& world) {
    auto* record = world.try_resource<InputRecord>();
    if (!record) return;

    auto player = gemrun::require_single<PlayerTag>(world, "player");
    gemrun::require_component<PlayerInput>(world, player, "PlayerInput") = map(*record);
}
