#pragma once
#include "../components.hpp"
#include "../input_state.hpp"
#include <ecs/ecs.hpp>

// Pre-Update. Folds the InputRecord into the player's two boolean signals.
class PlayerInputSystem {
public:
    static void Update(ecs::World& world);

    static PlayerInput map(const InputRecord& record);
};
