#pragma once
#include <ecs/ecs.hpp>

// Scrolls the player right at a constant speed and steers it vertically from
// PlayerInput. Fixed phase, first step; gated on Playing. No clamping: the
// player may drift arbitrarily far up or down.
class MotionSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Displacement for one tick. Pure, exposed for unit testing.
    static ecs::Vec2 displacement(int vertical_intent, float dt,
                                  float horizontal_speed, float vertical_speed);
};
