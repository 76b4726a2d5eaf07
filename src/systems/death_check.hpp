#pragma once
#include <ecs/ecs.hpp>

// Frame-phase, not gated. Latches Playing -> GameOver once the player's
// health is depleted. Level-triggered: safe to run every frame, and a no-op
// once GameOver has been entered.
class DeathCheckSystem {
public:
    // Returns true on the frame the transition happened.
    static bool Update(ecs::World& world);
};
