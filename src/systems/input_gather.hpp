#pragma once
#include <ecs/ecs.hpp>

// Pre-Update. Polls raylib's keyboard and gamepads into the InputRecord
// resource (created on first use).
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};
