#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>

// ---------------------------------------------------------------------------
// PickupSystem — Fixed phase, after CameraFollowSystem; gated on Playing.
//
// Every live gem strictly inside collection_radius of the player (x/y plane,
// depth ignored) is collected in the same tick, in creation order: the gem
// entity is destroyed, Score +1, Health -1 (clamped at 0), and a
// GemCollectedEvent plus a SoundRequest are queued. A destroyed gem is no
// longer iterated, so it can never be counted twice.
//
// The only writer of Score and Health.
// ---------------------------------------------------------------------------

class PickupSystem {
public:
    static void Register(ecs::World& world);

    // Returns the number of gems collected this tick.
    static std::size_t Update(ecs::World& world);
};
