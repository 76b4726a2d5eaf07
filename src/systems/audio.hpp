#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AudioSystem — Frame-phase system; drains Events<SoundRequest>.
//
// Runs after the fixed ticks of the frame, so every pickup of the frame is
// heard once. Fire-and-forget: nothing is reported back to the simulation.
// ---------------------------------------------------------------------------

class AudioSystem {
public:
    static void Update(ecs::World& world, float dt);
};
